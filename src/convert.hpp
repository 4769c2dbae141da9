#pragma once
#include "codec.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace cpr {

enum class Direction
{
    ToBin,
    ToCpr,
};

struct ConversionSummary
{
    size_t blocks = 0;
    size_t inputBytes = 0;
    size_t outputBytes = 0;
};

/// Output of one in-memory conversion and the number of blocks it carried
struct ConversionResult
{
    std::vector<uint8_t> bytes;
    size_t blocks = 0;
};

/**
 * Map the --to-bin / --to-cpr flags to a direction. Exactly one flag must
 * be set; anything else has no direction.
 */
std::optional<Direction> resolveDirection(bool toBin, bool toCpr);

std::vector<uint8_t> readFile(const std::filesystem::path& filename);

/**
 * Write @p bytes to a new temporary file next to @p filename and rename it
 * over @p filename. The temporary name is chosen so that it does not collide
 * with an existing file. On failure the temporary is removed and
 * std::runtime_error is thrown, so @p filename is either untouched or
 * complete.
 */
void writeFileAtomic(const std::filesystem::path& filename, std::span<const uint8_t> bytes);

/// Decode one format and encode the other, entirely in memory.
ConversionResult convertBuffer(Direction direction, std::span<const uint8_t> input);

/**
 * Read @p input, convert it and write @p output atomically. A
 * FormatException from the codec propagates and no output file is created.
 */
ConversionSummary convertFile(Direction direction, const std::filesystem::path& input, const std::filesystem::path& output);

} // namespace cpr
