#include "codec.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cpr {

std::array<uint8_t, 4> ByteReader::readTag(const char* what)
{
    require(4, what);
    std::array<uint8_t, 4> tag;
    std::copy_n(source.begin() + cursor, 4, tag.begin());
    cursor += 4;
    return tag;
}

uint32_t ByteReader::readLong(const char* what)
{
    require(4, what);
    uint32_t value = static_cast<uint32_t>(source[cursor]) |
                     (static_cast<uint32_t>(source[cursor + 1]) << 8) |
                     (static_cast<uint32_t>(source[cursor + 2]) << 16) |
                     (static_cast<uint32_t>(source[cursor + 3]) << 24);
    cursor += 4;
    return value;
}

std::span<const uint8_t> ByteReader::readBytes(size_t count, const char* what)
{
    require(count, what);
    auto slice = source.subspan(cursor, count);
    cursor += count;
    return slice;
}

void ByteWriter::emit(uint8_t byte)
{
    out.push_back(byte);
}

void ByteWriter::emitLong(uint32_t value)
{
    emit(static_cast<uint8_t>(value & 0x000000FF));
    emit(static_cast<uint8_t>((value & 0x0000FF00) >> 8));
    emit(static_cast<uint8_t>((value & 0x00FF0000) >> 16));
    emit(static_cast<uint8_t>((value & 0xFF000000) >> 24));
}

void ByteWriter::emitTag(const uint8_t (&tag)[4])
{
    out.insert(out.end(), tag, tag + 4);
}

void ByteWriter::emitTag(const std::array<uint8_t, 4>& tag)
{
    out.insert(out.end(), tag.begin(), tag.end());
}

void ByteWriter::emitBytes(std::span<const uint8_t> bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

static Riff_Header readRiffHeader(ByteReader& reader)
{
    if (reader.size() < Riff_Header::header_size()) {
        throw FormatException(FormatError::Truncated,
            "File is " + std::to_string(reader.size()) + " bytes, too short for a RIFF header", 0);
    }

    Riff_Header header;
    header.tag = reader.readTag("RIFF tag");
    if (!header.has_riff_magic()) {
        throw FormatException(FormatError::BadMagic, "Not a valid RIFF file", 0);
    }

    header.size = reader.readLong("RIFF size");

    header.form = reader.readTag("form type");
    if (!header.has_form_tag()) {
        throw FormatException(FormatError::BadFormTag, "Not a valid CPR file (missing AMS! form type)", 8);
    }

    return header;
}

static Chunk_Header readChunkHeader(ByteReader& reader)
{
    size_t start = reader.position();

    Chunk_Header header;
    header.id = reader.readTag("chunk id");
    if (!header.has_cart_id()) {
        throw FormatException(FormatError::BadChunkId,
            "Unexpected chunk '" + header.id_string() + "' at offset " + std::to_string(start) +
            ", expected cb00..cb99", start);
    }

    header.length = reader.readLong("chunk length");
    if (header.length > BLOCK_SIZE) {
        throw FormatException(FormatError::ChunkTooLarge,
            "Chunk " + header.id_string() + " declares " + std::to_string(header.length) +
            " bytes, limit is " + std::to_string(BLOCK_SIZE), start + 4);
    }

    return header;
}

Image decodeCpr(std::span<const uint8_t> bytes)
{
    ByteReader reader(bytes);
    Riff_Header riff = readRiffHeader(reader);

    size_t actual = bytes.size() - RIFF_SIZE_FIELD_END;
    if (riff.size != actual) {
        throw FormatException(FormatError::SizeMismatch,
            "RIFF header declares " + std::to_string(riff.size) + " bytes but " +
            std::to_string(actual) + " follow", 4);
    }

    std::vector<Block> blocks;
    while (!reader.is_eof()) {
        readChunkHeader(reader);
        // The slot is always full size; the declared length only says how
        // much of it was real data, so padding is kept as-is.
        blocks.push_back(Block::fromBytes(reader.readBytes(BLOCK_SIZE, "chunk data")));
    }

    if (!is_valid_block_count(blocks.size())) {
        throw FormatException(FormatError::BlockCountOutOfRange,
            "CPR file holds " + std::to_string(blocks.size()) + " blocks, expected 1 to " +
            std::to_string(MAX_BLOCKS), reader.position());
    }

    return Image(std::move(blocks));
}

std::vector<uint8_t> encodeCpr(const Image& image)
{
    if (!is_valid_block_count(image.size())) {
        throw FormatException(FormatError::BlockCountOutOfRange,
            "Cannot write " + std::to_string(image.size()) + " blocks, expected 1 to " +
            std::to_string(MAX_BLOCKS));
    }

    ByteWriter writer(cpr_file_size(image.size()));

    writer.emitTag(RIFF_MAGIC);
    writer.emitLong(riff_total_size(image.size()));
    writer.emitTag(FORM_TAG);

    for (size_t i = 0; i < image.size(); ++i) {
        writer.emitTag(Chunk_Header::make_id(i));
        writer.emitLong(static_cast<uint32_t>(BLOCK_SIZE));
        writer.emitBytes(image[i].data());
    }

    return writer.release();
}

Image decodeBin(std::span<const uint8_t> bytes)
{
    if (bytes.empty() || bytes.size() > MAX_IMAGE_SIZE) {
        throw FormatException(FormatError::SizeOutOfRange,
            "BIN file is " + std::to_string(bytes.size()) + " bytes, expected 1 to " +
            std::to_string(MAX_IMAGE_SIZE));
    }

    std::vector<Block> blocks;
    blocks.reserve(blocks_for_size(bytes.size()));
    for (size_t offset = 0; offset < bytes.size(); offset += BLOCK_SIZE) {
        size_t count = std::min(BLOCK_SIZE, bytes.size() - offset);
        blocks.push_back(Block::fromBytes(bytes.subspan(offset, count)));
    }

    return Image(std::move(blocks));
}

std::vector<uint8_t> encodeBin(const Image& image)
{
    ByteWriter writer(image.byteSize());
    for (const auto& block : image.blocks()) {
        writer.emitBytes(block.data());
    }
    return writer.release();
}

} // namespace cpr
