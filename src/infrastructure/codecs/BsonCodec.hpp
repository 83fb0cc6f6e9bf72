/**
 * @file BsonCodec.hpp
 * @brief BSON binary format (nlohmann::json). Extension `.bson`.
 *
 * BSON documents must be objects at the top level; anything else is
 * reported by the library as an EncodeError.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/Bytes.hpp"
#include "infrastructure/codecs/Document.hpp"

namespace stowage::infrastructure::codecs {

struct BsonCodec {
    static constexpr const char* kExtension = "bson";

    template <typename T>
    static domain::Bytes encode(const T& value) {
        const Document document = toDocument(value);
        try {
            return Document::to_bson(document);
        } catch (const nlohmann::json::exception& e) {
            throw domain::EncodeError(e.what());
        }
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        Document document;
        try {
            document = Document::from_bson(data, data + size);
        } catch (const nlohmann::json::exception& e) {
            throw domain::DecodeError(e.what());
        }
        return fromDocument<T>(document);
    }
};

} // namespace stowage::infrastructure::codecs
