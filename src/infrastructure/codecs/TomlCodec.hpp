/**
 * @file TomlCodec.hpp
 * @brief TOML file format (toml++). Extension `.toml`.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/Bytes.hpp"
#include "infrastructure/codecs/Document.hpp"

namespace stowage::infrastructure::codecs {

/**
 * @struct TomlCodec
 * @brief Converts the payload document to a toml::table and back.
 *
 * TOML has no null and no top-level scalars or arrays: such payloads are an
 * EncodeError. Integers must fit in int64. Dates and times read from
 * hand-written files decode as their TOML string form.
 */
struct TomlCodec {
    static constexpr const char* kExtension = "toml";

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
