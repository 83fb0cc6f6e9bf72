/**
 * @file BinaryCodec.hpp
 * @brief Raw bytes, written verbatim. Extension `.bin`.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "domain/Bytes.hpp"

namespace stowage::infrastructure::codecs {

struct BinaryCodec {
    static constexpr const char* kExtension = "bin";

    template <typename T>
    static domain::Bytes encode(const T& value) {
        static_assert(std::is_same_v<T, domain::Bytes> || std::is_same_v<T, std::string>,
                      "BinaryCodec stores Bytes or std::string payloads");
        return domain::Bytes(value.begin(), value.end());
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        static_assert(std::is_same_v<T, domain::Bytes> || std::is_same_v<T, std::string>,
                      "BinaryCodec stores Bytes or std::string payloads");
        if constexpr (std::is_same_v<T, std::string>) {
            return std::string(reinterpret_cast<const char*>(data), size);
        } else {
            return domain::Bytes(data, data + size);
        }
    }
};

} // namespace stowage::infrastructure::codecs
