/**
 * @file JsonCodec.hpp
 * @brief JSON file format (nlohmann::json). Extension `.json`.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "domain/Bytes.hpp"
#include "infrastructure/codecs/Document.hpp"

namespace stowage::infrastructure::codecs {

struct JsonCodec {
    static constexpr const char* kExtension = "json";

    /** @brief Pretty prints with a 4-space indent. */
    template <typename T>
    static domain::Bytes encode(const T& value) {
        const Document document = toDocument(value);
        std::string text;
        try {
            text = document.dump(4);
        } catch (const nlohmann::json::exception& e) {
            throw domain::EncodeError(e.what());
        }
        return domain::Bytes(text.begin(), text.end());
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        Document document;
        try {
            document = Document::parse(data, data + size);
        } catch (const nlohmann::json::exception& e) {
            throw domain::DecodeError(e.what());
        }
        return fromDocument<T>(document);
    }
};

} // namespace stowage::infrastructure::codecs
