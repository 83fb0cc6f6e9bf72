/**
 * @file MappedFile.cpp
 * @brief Implementation of MappedFile.
 */

#include "infrastructure/MappedFile.hpp"
#include "domain/Errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stowage::infrastructure {

using domain::PersistError;

namespace {

std::string errnoDescription(int err) {
    return std::string(std::strerror(err));
}

} // namespace

MappedFile::MappedFile(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        int err = errno;
        auto kind = err == ENOENT ? PersistError::Kind::NotFound : PersistError::Kind::Io;
        throw PersistError(kind, "couldn't open " + path.string() + ": " + errnoDescription(err), path);
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw PersistError(PersistError::Kind::Io, "fstat failed for " + path.string() + ": " + errnoDescription(err), path);
    }

    m_size = static_cast<std::size_t>(st.st_size);
    if (m_size > 0) {
        void* view = ::mmap(nullptr, m_size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) {
            int err = errno;
            ::close(fd);
            m_size = 0;
            throw PersistError(PersistError::Kind::Io,
                               "mmap failed for " + path.string() + " len:" + std::to_string(st.st_size) + " " + errnoDescription(err),
                               path);
        }
        m_data = static_cast<const std::uint8_t*>(view);
    }

    // The mapping stays valid after the descriptor is closed.
    ::close(fd);
}

MappedFile::~MappedFile() {
    release();
}

MappedFile::MappedFile(MappedFile&& other) noexcept
    : m_data(std::exchange(other.m_data, nullptr)), m_size(std::exchange(other.m_size, 0)) {}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
    if (this != &other) {
        release();
        m_data = std::exchange(other.m_data, nullptr);
        m_size = std::exchange(other.m_size, 0);
    }
    return *this;
}

void MappedFile::release() {
    if (m_data) {
        ::munmap(const_cast<std::uint8_t*>(m_data), m_size);
        m_data = nullptr;
        m_size = 0;
    }
}

} // namespace stowage::infrastructure
