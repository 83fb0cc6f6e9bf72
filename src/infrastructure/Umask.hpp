/**
 * @file Umask.hpp
 * @brief Process-wide permission mask for created files and directories.
 */

#pragma once

#include <sys/types.h>

namespace stowage::infrastructure {

/**
 * @brief Sets the process umask and returns the previous one.
 *
 * This is umask, not chmod: umask(0037) yields 0640 files and 0740
 * directories. Applies to the whole process, not only to this library.
 */
mode_t SetUmask(mode_t mask);

} // namespace stowage::infrastructure
