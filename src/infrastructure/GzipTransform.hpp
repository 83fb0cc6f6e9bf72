/**
 * @file GzipTransform.hpp
 * @brief gzip compression layered around a codec's byte sequence (zlib).
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/Bytes.hpp"

namespace stowage::infrastructure {

/**
 * @class GzipTransform
 * @brief Stateless gzip compress/decompress, independent of any format.
 */
class GzipTransform {
public:
    /**
     * @brief Compresses to a single gzip member.
     * @param level zlib level; the default favours speed.
     * @throws domain::EncodeError on zlib failure.
     */
    static domain::Bytes Compress(const std::uint8_t* data, std::size_t size, int level = 1);
    static domain::Bytes Compress(const domain::Bytes& bytes, int level = 1);

    /**
     * @brief Inflates a gzip (or zlib) stream.
     * @throws domain::DecodeError when the input is not a complete, valid stream.
     */
    static domain::Bytes Decompress(const std::uint8_t* data, std::size_t size);
    static domain::Bytes Decompress(const domain::Bytes& bytes);

    /**
     * @brief Compress() and Decompress() with the input handed to zlib in
     * blocks of at most `blockSize` bytes.
     *
     * zlib counts input in 32-bit units, so the plain overloads use the
     * largest block it accepts.
     */
    static domain::Bytes CompressBlocks(const std::uint8_t* data, std::size_t size, int level, std::size_t blockSize);
    static domain::Bytes DecompressBlocks(const std::uint8_t* data, std::size_t size, std::size_t blockSize);
};

} // namespace stowage::infrastructure
