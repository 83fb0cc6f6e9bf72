/**
 * @file HeaderedCodec.hpp
 * @brief Wraps any codec with a fixed 24-byte signature and a version byte.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include "domain/Bytes.hpp"
#include "domain/Errors.hpp"

namespace stowage::infrastructure::codecs {

constexpr std::size_t kHeaderLength = 24;
using Header = std::array<std::uint8_t, kHeaderLength>;

/**
 * @brief Renders header bytes as a bracketed list, e.g. "[1, 2, 3]".
 */
inline std::string HeaderToString(const std::uint8_t* data, std::size_t size) {
    std::ostringstream os;
    os << '[';
    for (std::size_t i = 0; i < size; ++i) {
        if (i != 0) os << ", ";
        os << static_cast<unsigned>(data[i]);
    }
    os << ']';
    return os.str();
}

/**
 * @class HeaderedCodec
 * @brief Layout on disk: 24 signature bytes, one version byte, then the
 * inner codec's payload.
 *
 * `Signature` supplies:
 *   - `static constexpr Header kHeader`
 *   - `static constexpr std::uint8_t kVersion`
 *   - `static constexpr const char* kExtension`
 *
 * Decoding checks the signature first and the version second. A mismatch
 * in either is a DecodeError naming what was expected and found.
 */
template <typename Inner, typename Signature>
struct HeaderedCodec {
    static constexpr const char* kExtension = Signature::kExtension;
    static constexpr std::size_t kPrefixLength = kHeaderLength + 1;

    template <typename T>
    static domain::Bytes encode(const T& value) {
        domain::Bytes inner = Inner::template encode<T>(value);
        domain::Bytes out;
        out.reserve(kPrefixLength + inner.size());
        out.insert(out.end(), Signature::kHeader.begin(), Signature::kHeader.end());
        out.push_back(Signature::kVersion);
        out.insert(out.end(), inner.begin(), inner.end());
        return out;
    }

    template <typename T>
    static T decode(const std::uint8_t* data, std::size_t size) {
        CheckPrefix(data, size);
        return Inner::template decode<T>(data + kPrefixLength, size - kPrefixLength);
    }

    static void CheckPrefix(const std::uint8_t* data, std::size_t size) {
        if (size < kPrefixLength) {
            throw domain::DecodeError("Invalid header bytes, total byte length less than " +
                                      std::to_string(kPrefixLength) + ": " + std::to_string(size));
        }
        for (std::size_t i = 0; i < kHeaderLength; ++i) {
            if (data[i] != Signature::kHeader[i]) {
                throw domain::DecodeError("Incorrect header bytes\nExpected: " +
                                          HeaderToString(Signature::kHeader.data(), kHeaderLength) +
                                          "\nFound: " + HeaderToString(data, kHeaderLength));
            }
        }
        if (data[kHeaderLength] != Signature::kVersion) {
            throw domain::DecodeError("Incorrect version byte\nExpected: " +
                                      std::to_string(static_cast<unsigned>(Signature::kVersion)) +
                                      "\nFound: " + std::to_string(static_cast<unsigned>(data[kHeaderLength])));
        }
    }

    /// Version byte stored in an encoded buffer.
    static std::uint8_t VersionOf(const std::uint8_t* data, std::size_t size) {
        if (size < kPrefixLength) {
            throw domain::DecodeError("Invalid header bytes, total byte length less than " +
                                      std::to_string(kPrefixLength) + ": " + std::to_string(size));
        }
        return data[kHeaderLength];
    }
};

} // namespace stowage::infrastructure::codecs
