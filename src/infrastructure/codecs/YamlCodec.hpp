/**
 * @file YamlCodec.hpp
 * @brief YAML file format (yaml-cpp). Extension `.yaml`.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/Bytes.hpp"
#include "infrastructure/codecs/Document.hpp"

namespace stowage::infrastructure::codecs {

/**
 * @struct YamlCodec
 * @brief Emits the payload document with yaml-cpp and reads it back.
 *
 * Strings are always double-quoted so "7" or "true" stay strings; plain
 * scalars are resolved as integer, float, bool, then string.
 */
struct YamlCodec {
    static constexpr const char* kExtension = "yaml";

    template <typename T>
    static domain::Bytes encode(const T& value) {
        return DocumentToBytes(toDocument(value));
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        return fromDocument<T>(BytesToDocument(data, size));
    }

    static domain::Bytes DocumentToBytes(const Document& document);
    static Document BytesToDocument(const std::uint8_t* data, std::size_t size);
};

} // namespace stowage::infrastructure::codecs
