#include "image.hpp"
#include <algorithm>
#include <string>

namespace cpr {

Block Block::fromBytes(std::span<const uint8_t> data)
{
    if (data.size() > BLOCK_SIZE) {
        throw FormatException(FormatError::ChunkTooLarge,
            "Block data is " + std::to_string(data.size()) + " bytes, limit is " + std::to_string(BLOCK_SIZE));
    }

    Block block;
    std::copy(data.begin(), data.end(), block.bytes.begin());
    return block;
}

} // namespace cpr
