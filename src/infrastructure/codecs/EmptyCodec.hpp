/**
 * @file EmptyCodec.hpp
 * @brief Marker-file format: zero bytes on disk, no extension.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "domain/Bytes.hpp"
#include "domain/Errors.hpp"

namespace stowage::infrastructure::codecs {

/**
 * @struct EmptyCodec
 * @brief Only the presence of the file matters. Decoding yields T{}.
 */
struct EmptyCodec {
    static constexpr const char* kExtension = "";

    template <typename T>
    static domain::Bytes encode(const T&) {
        return {};
    }

    template <typename T>
    static T decode(const std::uint8_t*, std::size_t size) {
        if (size != 0) {
            throw domain::DecodeError("Expected an empty file, found " + std::to_string(size) + " bytes");
        }
        return T{};
    }
};

} // namespace stowage::infrastructure::codecs
