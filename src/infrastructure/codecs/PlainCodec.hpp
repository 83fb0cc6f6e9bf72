/**
 * @file PlainCodec.hpp
 * @brief Human-readable single-value text format. Extension `.txt`.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "domain/Bytes.hpp"
#include "infrastructure/codecs/Document.hpp"

namespace stowage::infrastructure::codecs {

/**
 * @struct PlainCodec
 * @brief Writes a scalar as its plain textual form.
 *
 * Strings are written verbatim (no quotes). Numbers and booleans use their
 * JSON spelling. Structured values are rejected with EncodeError. Decoding
 * is driven by the requested type.
 */
struct PlainCodec {
    static constexpr const char* kExtension = "txt";

    template <typename T>
    static domain::Bytes encode(const T& value) {
        if constexpr (std::is_same_v<T, std::string>) {
            return domain::Bytes(value.begin(), value.end());
        } else {
            const Document document = toDocument(value);
            std::string text;
            if (document.is_string()) {
                text = document.template get<std::string>();
            } else if (document.is_boolean() || document.is_number()) {
                text = document.dump();
            } else {
                throw domain::EncodeError(std::string("Plain text holds a single scalar, got ") +
                                          document.type_name());
            }
            return domain::Bytes(text.begin(), text.end());
        }
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        std::string text(reinterpret_cast<const char*>(data), size);
        if constexpr (std::is_same_v<T, std::string>) {
            return text;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (text == "true") return true;
            if (text == "false") return false;
            throw domain::DecodeError("Expected true or false, found \"" + text + "\"");
        } else if constexpr (std::is_arithmetic_v<T>) {
            return parseNumber<T>(text);
        } else {
            return fromDocument<T>(Document(text));
        }
    }

private:
    template <typename T>
    static T parseNumber(const std::string& text) {
        const Document number = Document::parse(text, nullptr, false);
        if (!number.is_number()) {
            throw domain::DecodeError("Expected a number, found \"" + text + "\"");
        }
        if constexpr (std::is_integral_v<T>) {
            if (number.is_number_float()) {
                throw domain::DecodeError("Expected an integer, found \"" + text + "\"");
            }
            if (number.is_number_unsigned()) {
                const auto u = number.template get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                    throw domain::DecodeError("Integer out of range: " + text);
                }
                return static_cast<T>(u);
            }
            const auto i = number.template get<std::int64_t>();
            if constexpr (std::is_unsigned_v<T>) {
                if (i < 0) {
                    throw domain::DecodeError("Expected a non-negative integer, found " + text);
                }
                if (static_cast<std::uint64_t>(i) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                    throw domain::DecodeError("Integer out of range: " + text);
                }
            } else {
                if (i < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                    i > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                    throw domain::DecodeError("Integer out of range: " + text);
                }
            }
            return static_cast<T>(i);
        } else {
            return static_cast<T>(number.template get<double>());
        }
    }
};

} // namespace stowage::infrastructure::codecs
