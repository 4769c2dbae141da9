#pragma once
#include "cpr.hpp"
#include "image.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cpr {

/**
 * Bounds-checked cursor over an input buffer. Every read that would run past
 * the end throws FormatException(Truncated) with the current offset.
 */
class ByteReader
{
    std::span<const uint8_t> source;
    size_t cursor = 0;

    inline void require(size_t count, const char* what) const
    {
        if (remaining() < count)
            throw FormatException(FormatError::Truncated,
                std::string("Unexpected end of data reading ") + what + " at offset " + std::to_string(cursor) +
                ": need " + std::to_string(count) + " bytes, " + std::to_string(remaining()) + " left",
                cursor);
    }

public:
    explicit ByteReader(std::span<const uint8_t> src) : source(src) {}

    std::array<uint8_t, 4> readTag(const char* what = "tag");
    uint32_t readLong(const char* what = "length");
    std::span<const uint8_t> readBytes(size_t count, const char* what = "data");

    constexpr bool is_eof() const { return cursor >= source.size(); }
    constexpr size_t remaining() const { return is_eof() ? 0 : source.size() - cursor; }
    constexpr size_t position() const { return cursor; }
    constexpr size_t size() const { return source.size(); }
};

/**
 * Append-only output buffer.
 */
class ByteWriter
{
    std::vector<uint8_t> out;

public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { out.reserve(reserve); }

    void emit(uint8_t byte);
    void emitLong(uint32_t value);
    void emitTag(const uint8_t (&tag)[4]);
    void emitTag(const std::array<uint8_t, 4>& tag);
    void emitBytes(std::span<const uint8_t> bytes);

    size_t size() const { return out.size(); }
    std::vector<uint8_t> release() { return std::move(out); }
};

// --- CPR container ---

/**
 * Parse a CPR file into its blocks.
 *
 * Checks, in order: room for the 12 byte preamble, "RIFF", "AMS!", the total
 * size field against the buffer length, then each chunk's id and length and
 * the presence of its full 16384 byte slot, and finally the block count.
 * The first failure throws FormatException; nothing is returned partially.
 */
Image decodeCpr(std::span<const uint8_t> bytes);

/// Serialise @p image as a CPR file. Throws BlockCountOutOfRange outside [1, 32].
std::vector<uint8_t> encodeCpr(const Image& image);

// --- Flat BIN dump ---

Image decodeBin(std::span<const uint8_t> bytes);
std::vector<uint8_t> encodeBin(const Image& image);

} // namespace cpr
