/**
 * @file Bytes.hpp
 * @brief Byte sequence type shared by codecs, transforms and file I/O.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace stowage::domain {

using Bytes = std::vector<std::uint8_t>;

} // namespace stowage::domain
