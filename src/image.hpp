#pragma once
#include "cpr.hpp"
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace cpr {

/**
 * One 16KB cartridge bank. The buffer is always exactly BLOCK_SIZE bytes;
 * shorter data is zero-padded on the tail.
 */
class Block
{
    std::vector<uint8_t> bytes;

public:
    Block() : bytes(BLOCK_SIZE, 0) {}

    /**
     * Copy @p data into a new block and zero-pad it to BLOCK_SIZE.
     * Throws FormatException(ChunkTooLarge) if @p data does not fit.
     */
    static Block fromBytes(std::span<const uint8_t> data);

    const std::vector<uint8_t>& data() const { return bytes; }
    constexpr size_t size() const { return BLOCK_SIZE; }

    uint8_t operator[](size_t i) const { return bytes[i]; }

    bool operator==(const Block& other) const = default;
};

/**
 * Ordered sequence of blocks: the in-memory form shared by CPR and BIN.
 * Position in the sequence is the chunk number in a CPR file and the append
 * order in a BIN dump. An image is built once from its blocks and not
 * changed afterwards. The count is not checked here; the encoders and
 * decoders enforce the [1, 32] range.
 */
class Image
{
    std::vector<Block> blockList;

public:
    Image() = default;
    explicit Image(std::vector<Block> blocks) : blockList(std::move(blocks)) {}

    const std::vector<Block>& blocks() const { return blockList; }
    size_t size() const { return blockList.size(); }
    bool empty() const { return blockList.empty(); }

    /// Bytes the image occupies once flattened, always size() * BLOCK_SIZE
    size_t byteSize() const { return blockList.size() * BLOCK_SIZE; }

    const Block& operator[](size_t i) const { return blockList[i]; }

    bool operator==(const Image& other) const = default;
};

} // namespace cpr
