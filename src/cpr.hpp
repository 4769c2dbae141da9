/**
 * @file cpr.hpp
 * @brief Byte layout of the Amstrad CPR cartridge container
 *
 * A CPR file is a RIFF container of form type "AMS!" holding one "cbNN"
 * chunk per 16KB bank of cartridge ROM:
 *
 *   offset 0   "RIFF"
 *   offset 4   total size (u32 LE) = file size - 8
 *   offset 8   "AMS!"
 *   offset 12  chunk[0] ... chunk[N-1]
 *
 *   chunk[i]   "cb" + two decimal digits, length (u32 LE), 16384 data bytes
 *
 * Only single-expression helpers live here; decoding and encoding are in
 * codec.cpp.
 */

#ifndef CPR_FORMAT_HPP
#define CPR_FORMAT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// =============================================================================
// CRITICAL: BYTE ORDERING
// =============================================================================

/**
 * @brief BYTE ORDER: ALL MULTI-BYTE VALUES ARE LITTLE-ENDIAN
 *
 * This applies to the RIFF total size field and every chunk length field.
 * They are always assembled byte by byte, never by casting the buffer to a
 * packed struct, so the host byte order does not matter.
 *
 * Example: 16384 (0x00004000) is stored as bytes [0x00, 0x40, 0x00, 0x00]
 */

namespace cpr {

// =============================================================================
// FORMAT CONSTANTS
// =============================================================================

/// Container tag at offset 0: "RIFF"
constexpr uint8_t RIFF_MAGIC[4] = {0x52, 0x49, 0x46, 0x46};

/// Form type at offset 8: "AMS!"
constexpr uint8_t FORM_TAG[4] = {0x41, 0x4D, 0x53, 0x21};

/// First two bytes of every cartridge chunk id: "cb"
constexpr uint8_t CHUNK_PREFIX[2] = {0x63, 0x62};

/// Size of one cartridge bank. Every block is stored at exactly this size.
constexpr size_t BLOCK_SIZE = 16384;

/// 512KB cartridge limit expressed in banks
constexpr size_t MAX_BLOCKS = 32;
constexpr size_t MIN_BLOCKS = 1;

/// Largest BIN dump that fits in a cartridge
constexpr size_t MAX_IMAGE_SIZE = MAX_BLOCKS * BLOCK_SIZE;

constexpr size_t RIFF_HEADER_SIZE = 12;
constexpr size_t CHUNK_HEADER_SIZE = 8;

/// The total size field counts everything after itself, starting with "AMS!"
constexpr size_t RIFF_SIZE_FIELD_END = 8;

constexpr inline bool is_valid_block_count(size_t count) noexcept {
    return count >= MIN_BLOCKS && count <= MAX_BLOCKS;
}

/**
 * @brief Value of the RIFF total size field for a file of @p blocks chunks
 * @return 4 + blocks * (8 + 16384)
 */
constexpr inline uint32_t riff_total_size(size_t blocks) noexcept {
    return static_cast<uint32_t>(sizeof(FORM_TAG) + blocks * (CHUNK_HEADER_SIZE + BLOCK_SIZE));
}

/**
 * @brief Length of a CPR file holding @p blocks chunks
 * @return 12 + blocks * (8 + 16384)
 */
constexpr inline size_t cpr_file_size(size_t blocks) noexcept {
    return RIFF_HEADER_SIZE + blocks * (CHUNK_HEADER_SIZE + BLOCK_SIZE);
}

/// Number of 16KB blocks needed to hold @p bytes bytes
constexpr inline size_t blocks_for_size(size_t bytes) noexcept {
    return (bytes + BLOCK_SIZE - 1) / BLOCK_SIZE;
}

constexpr inline bool is_ascii_digit(uint8_t c) noexcept {
    return c >= '0' && c <= '9';
}

// =============================================================================
// HEADER STRUCTURES
// =============================================================================

/**
 * @brief The fixed 12 byte preamble, decoded
 */
struct Riff_Header {
    std::array<uint8_t, 4> tag{};   ///< Must be "RIFF"
    uint32_t size = 0;              ///< Byte count following this field
    std::array<uint8_t, 4> form{};  ///< Must be "AMS!"

    bool has_riff_magic() const noexcept {
        return tag[0] == RIFF_MAGIC[0] && tag[1] == RIFF_MAGIC[1] &&
               tag[2] == RIFF_MAGIC[2] && tag[3] == RIFF_MAGIC[3];
    }

    bool has_form_tag() const noexcept {
        return form[0] == FORM_TAG[0] && form[1] == FORM_TAG[1] &&
               form[2] == FORM_TAG[2] && form[3] == FORM_TAG[3];
    }

    static constexpr size_t header_size() noexcept {
        return RIFF_HEADER_SIZE;
    }
};

/**
 * @brief The 8 byte header in front of every chunk, decoded
 *
 * @c length records how many bytes of the slot were real data when the file
 * was written. The slot itself is always BLOCK_SIZE bytes.
 */
struct Chunk_Header {
    std::array<uint8_t, 4> id{};
    uint32_t length = 0;

    /**
     * @brief True when the id is "cb" followed by two ASCII digits
     */
    bool has_cart_id() const noexcept {
        return id[0] == CHUNK_PREFIX[0] && id[1] == CHUNK_PREFIX[1] &&
               is_ascii_digit(id[2]) && is_ascii_digit(id[3]);
    }

    std::string id_string() const {
        return std::string(id.begin(), id.end());
    }

    /**
     * @brief Build the chunk id for bank @p index ("cb00", "cb01", ...)
     */
    static constexpr std::array<uint8_t, 4> make_id(size_t index) noexcept {
        return {CHUNK_PREFIX[0], CHUNK_PREFIX[1],
                static_cast<uint8_t>('0' + (index / 10) % 10),
                static_cast<uint8_t>('0' + index % 10)};
    }

    static constexpr size_t header_size() noexcept {
        return CHUNK_HEADER_SIZE;
    }
};

// =============================================================================
// ERRORS
// =============================================================================

enum class FormatError {
    Truncated,             ///< Buffer shorter than the structure being read
    BadMagic,              ///< Container tag is not "RIFF"
    BadFormTag,            ///< Form type is not "AMS!"
    BadChunkId,            ///< Chunk id is not "cb" + two digits
    SizeMismatch,          ///< RIFF size field disagrees with the buffer
    ChunkTooLarge,         ///< Declared chunk length exceeds BLOCK_SIZE
    BlockCountOutOfRange,  ///< Fewer than 1 or more than 32 blocks
    SizeOutOfRange         ///< BIN input empty or larger than 512KB
};

constexpr inline const char* to_string(FormatError error) noexcept {
    switch (error) {
        case FormatError::Truncated:            return "Truncated";
        case FormatError::BadMagic:             return "BadMagic";
        case FormatError::BadFormTag:           return "BadFormTag";
        case FormatError::BadChunkId:           return "BadChunkId";
        case FormatError::SizeMismatch:         return "SizeMismatch";
        case FormatError::ChunkTooLarge:        return "ChunkTooLarge";
        case FormatError::BlockCountOutOfRange: return "BlockCountOutOfRange";
        case FormatError::SizeOutOfRange:       return "SizeOutOfRange";
    }
    return "Unknown";
}

/**
 * @brief Thrown by every codec operation that rejects its input
 *
 * @c offset is the buffer position where decoding stopped, or 0 when the
 * failure is not tied to a position (encode, BIN size checks).
 */
class FormatException : public std::runtime_error {
public:
    FormatException(FormatError kind, const std::string& message, size_t offset = 0)
        : std::runtime_error(message), kind_(kind), offset_(offset) {}

    FormatError kind() const noexcept { return kind_; }
    size_t offset() const noexcept { return offset_; }

private:
    FormatError kind_;
    size_t offset_;
};

} // namespace cpr

#endif // CPR_FORMAT_HPP
