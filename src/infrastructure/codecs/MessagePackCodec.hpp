/**
 * @file MessagePackCodec.hpp
 * @brief MessagePack binary format (nlohmann::json). Extension `.messagepack`.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/Bytes.hpp"
#include "infrastructure/codecs/Document.hpp"

namespace stowage::infrastructure::codecs {

struct MessagePackCodec {
    static constexpr const char* kExtension = "messagepack";

    template <typename T>
    static domain::Bytes encode(const T& value) {
        const Document document = toDocument(value);
        try {
            return Document::to_msgpack(document);
        } catch (const nlohmann::json::exception& e) {
            throw domain::EncodeError(e.what());
        }
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        Document document;
        try {
            document = Document::from_msgpack(data, data + size);
        } catch (const nlohmann::json::exception& e) {
            throw domain::DecodeError(e.what());
        }
        return fromDocument<T>(document);
    }
};

} // namespace stowage::infrastructure::codecs
