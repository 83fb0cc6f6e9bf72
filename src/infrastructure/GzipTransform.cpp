/**
 * @file GzipTransform.cpp
 * @brief Implementation of GzipTransform.
 */

#include "infrastructure/GzipTransform.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <zlib.h>

namespace stowage::infrastructure {

using domain::Bytes;

namespace {

constexpr int kGzipWindowBits = 15 + 16;        // gzip wrapper
constexpr int kAutoDetectWindowBits = 15 + 32;  // gzip or zlib wrapper
constexpr std::size_t kChunk = 64 * 1024;
constexpr std::size_t kMaxBlock = std::numeric_limits<uInt>::max();

std::string zlibMessage(const z_stream& zs, int code) {
    if (zs.msg) return zs.msg;
    return "zlib error " + std::to_string(code);
}

/// Input not yet handed to zlib.
struct PendingInput {
    const std::uint8_t* next;
    std::size_t remaining;
    std::size_t blockSize;

    // Tops up avail_in once zlib has consumed the previous block.
    void feed(z_stream& zs) {
        if (zs.avail_in != 0 || remaining == 0) return;
        const std::size_t block = std::min(remaining, blockSize);
        zs.next_in = const_cast<Bytef*>(next);
        zs.avail_in = static_cast<uInt>(block);
        next += block;
        remaining -= block;
    }

    bool exhausted(const z_stream& zs) const { return remaining == 0 && zs.avail_in == 0; }
};

std::size_t checkedBlockSize(std::size_t blockSize) {
    return std::max<std::size_t>(1, std::min(blockSize, kMaxBlock));
}

} // namespace

Bytes GzipTransform::CompressBlocks(const std::uint8_t* data, std::size_t size, int level, std::size_t blockSize) {
    z_stream zs{};
    int rc = deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw domain::EncodeError("gzip: deflateInit2 failed: " + zlibMessage(zs, rc));
    }

    PendingInput input{data, size, checkedBlockSize(blockSize)};
    Bytes out;
    out.reserve(std::min<std::size_t>(size / 2 + kChunk, kMaxBlock));

    std::uint8_t buffer[kChunk];
    do {
        input.feed(zs);
        // Z_FINISH only once the last block is with zlib.
        const int flush = input.remaining == 0 ? Z_FINISH : Z_NO_FLUSH;
        zs.next_out = buffer;
        zs.avail_out = static_cast<uInt>(kChunk);
        rc = deflate(&zs, flush);
        if (rc == Z_STREAM_ERROR) {
            std::string message = zlibMessage(zs, rc);
            deflateEnd(&zs);
            throw domain::EncodeError("gzip: deflate failed: " + message);
        }
        out.insert(out.end(), buffer, buffer + (kChunk - zs.avail_out));
    } while (rc != Z_STREAM_END);

    deflateEnd(&zs);
    return out;
}

Bytes GzipTransform::Compress(const std::uint8_t* data, std::size_t size, int level) {
    return CompressBlocks(data, size, level, kMaxBlock);
}

Bytes GzipTransform::Compress(const Bytes& bytes, int level) {
    return Compress(bytes.data(), bytes.size(), level);
}

Bytes GzipTransform::DecompressBlocks(const std::uint8_t* data, std::size_t size, std::size_t blockSize) {
    z_stream zs{};
    int rc = inflateInit2(&zs, kAutoDetectWindowBits);
    if (rc != Z_OK) {
        throw domain::DecodeError("gzip: inflateInit2 failed: " + zlibMessage(zs, rc));
    }

    PendingInput input{data, size, checkedBlockSize(blockSize)};
    Bytes out;
    std::uint8_t buffer[kChunk];
    do {
        input.feed(zs);
        zs.next_out = buffer;
        zs.avail_out = static_cast<uInt>(kChunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            std::string message = zlibMessage(zs, rc);
            inflateEnd(&zs);
            throw domain::DecodeError("gzip: corrupt stream: " + message);
        }
        out.insert(out.end(), buffer, buffer + (kChunk - zs.avail_out));
        if (rc == Z_BUF_ERROR && input.exhausted(zs)) {
            inflateEnd(&zs);
            throw domain::DecodeError("gzip: unexpected end of stream");
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

Bytes GzipTransform::Decompress(const std::uint8_t* data, std::size_t size) {
    return DecompressBlocks(data, size, kMaxBlock);
}

Bytes GzipTransform::Decompress(const Bytes& bytes) {
    return Decompress(bytes.data(), bytes.size());
}

} // namespace stowage::infrastructure
