/**
 * @file Document.hpp
 * @brief The structured data model shared by the document-based codecs.
 *
 * Payload types opt in through the ADL `to_json`/`from_json` pair of
 * nlohmann::json (or NLOHMANN_DEFINE_TYPE_*). Codecs convert the resulting
 * document into their own format through their library.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"

namespace stowage::infrastructure::codecs {

using Document = nlohmann::json;

/** @brief Converts a payload to a document. @throws domain::EncodeError */
template <typename T>
Document toDocument(const T& value) {
    try {
        Document document = value;
        return document;
    } catch (const nlohmann::json::exception& e) {
        throw domain::EncodeError(e.what());
    }
}

/** @brief Converts a document back to a payload. @throws domain::DecodeError */
template <typename T>
T fromDocument(const Document& document) {
    try {
        return document.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw domain::DecodeError(e.what());
    }
}

} // namespace stowage::infrastructure::codecs
