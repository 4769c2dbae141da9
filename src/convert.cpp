#include "convert.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

namespace cpr {

// Temporary names tried before giving up: "<name>.tmp", "<name>.tmp1", ...
static constexpr int MAX_TEMP_ATTEMPTS = 100;

std::optional<Direction> resolveDirection(bool toBin, bool toCpr)
{
    if (toBin == toCpr) {
        return std::nullopt;
    }
    return toBin ? Direction::ToBin : Direction::ToCpr;
}

std::vector<uint8_t> readFile(const std::filesystem::path& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename.string());
    }

    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Could not read file: " + filename.string());
    }
    return buffer;
}

static std::filesystem::path unusedTempPath(const std::filesystem::path& filename)
{
    for (int attempt = 0; attempt < MAX_TEMP_ATTEMPTS; ++attempt) {
        std::filesystem::path temp = filename;
        temp += attempt == 0 ? std::string(".tmp") : ".tmp" + std::to_string(attempt);

        std::error_code ec;
        if (!std::filesystem::exists(temp, ec) && !ec) {
            return temp;
        }
    }
    throw std::runtime_error("Could not find a free temporary name next to " + filename.string());
}

void writeFileAtomic(const std::filesystem::path& filename, std::span<const uint8_t> bytes)
{
    std::filesystem::path temp = unusedTempPath(filename);

    {
        std::ofstream outfile(temp, std::ios::binary | std::ios::trunc);
        if (!outfile.is_open()) {
            throw std::runtime_error("Could not create file: " + temp.string());
        }
        outfile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        outfile.flush();
        if (!outfile) {
            outfile.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw std::runtime_error("Could not write file: " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, filename, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw std::runtime_error("Could not rename " + temp.string() + " to " + filename.string() + ": " + ec.message());
    }
}

ConversionResult convertBuffer(Direction direction, std::span<const uint8_t> input)
{
    switch (direction)
    {
    case Direction::ToBin: {
        Image image = decodeCpr(input);
        return {encodeBin(image), image.size()};
    }
    case Direction::ToCpr: {
        Image image = decodeBin(input);
        return {encodeCpr(image), image.size()};
    }
    }
    throw std::invalid_argument("Unknown conversion direction");
}

ConversionSummary convertFile(Direction direction, const std::filesystem::path& input, const std::filesystem::path& output)
{
    auto source = readFile(input);
    auto result = convertBuffer(direction, source);

    writeFileAtomic(output, result.bytes);

    ConversionSummary summary;
    summary.blocks = result.blocks;
    summary.inputBytes = source.size();
    summary.outputBytes = result.bytes.size();
    return summary;
}

} // namespace cpr
