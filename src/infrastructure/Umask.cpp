#include "infrastructure/Umask.hpp"
#include "infrastructure/Log.hpp"

#include <sys/stat.h>

#include <sstream>

namespace stowage::infrastructure {

mode_t SetUmask(mode_t mask) {
    mode_t previous = ::umask(mask);
    if (Log::Enabled(LogLevel::Debug)) {
        std::ostringstream os;
        os << "umask " << std::oct << previous << " -> " << mask;
        Log::Debug("Umask", os.str());
    }
    return previous;
}

} // namespace stowage::infrastructure
