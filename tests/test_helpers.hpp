#pragma once
#include <gtest/gtest.h>
#include "../src/codec.hpp"
#include "../src/convert.hpp"
#include "../src/cpr.hpp"
#include "../src/image.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Compare byte vectors with detailed error messages
 */
inline void expectBytes(const std::vector<uint8_t>& actual,
                        const std::vector<uint8_t>& expected,
                        const std::string& msg = "") {
    ASSERT_EQ(actual.size(), expected.size())
        << msg << " size mismatch: expected " << expected.size()
        << " bytes, got " << actual.size();
    auto mismatch = std::mismatch(actual.begin(), actual.end(), expected.begin());
    if (mismatch.first != actual.end()) {
        size_t i = static_cast<size_t>(mismatch.first - actual.begin());
        ADD_FAILURE() << msg << " byte mismatch at index " << i
                      << ": expected 0x" << std::hex << static_cast<int>(expected[i])
                      << ", got 0x" << static_cast<int>(actual[i]);
    }
}

/**
 * @brief Create a hex dump string for debugging
 */
inline std::string hexDump(const std::vector<uint8_t>& data, size_t maxBytes = 64) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t count = std::min(data.size(), maxBytes);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0 && i % 16 == 0) oss << "\n";
        else if (i > 0) oss << " ";
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    if (data.size() > maxBytes) {
        oss << "... (" << (data.size() - maxBytes) << " more bytes)";
    }
    return oss.str();
}

/**
 * @brief Extract a range of bytes from a vector
 */
inline std::vector<uint8_t> extractBytes(const std::vector<uint8_t>& data,
                                         size_t start, size_t length) {
    if (start >= data.size()) return {};
    size_t end = std::min(start + length, data.size());
    return std::vector<uint8_t>(data.begin() + start, data.begin() + end);
}

/**
 * @brief Read a 32-bit little-endian value from a byte vector
 */
inline uint32_t readLong(const std::vector<uint8_t>& data, size_t offset) {
    if (offset + 3 >= data.size()) return 0;
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

inline std::string readTag(const std::vector<uint8_t>& data, size_t offset) {
    if (offset + 4 > data.size()) return {};
    return std::string(data.begin() + offset, data.begin() + offset + 4);
}

inline void appendTag(std::vector<uint8_t>& out, const std::string& tag) {
    out.insert(out.end(), tag.begin(), tag.end());
}

inline void appendLong(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

// ============================================================================
// FORMAT CONSTANTS FOR TESTING
// ============================================================================
namespace TestConstants {
    constexpr size_t BLOCK = 16384;
    constexpr size_t CHUNK = 8 + BLOCK;
    constexpr size_t HEADER = 12;
    constexpr size_t MAX_BIN = 524288;
}

/**
 * @brief Run @p fn and check it throws FormatException of kind @p expected
 */
template <typename Fn>
void expectFormatError(Fn&& fn, cpr::FormatError expected) {
    try {
        fn();
        ADD_FAILURE() << "Expected FormatException(" << cpr::to_string(expected) << "), nothing was thrown";
    } catch (const cpr::FormatException& e) {
        EXPECT_EQ(e.kind(), expected)
            << "Expected " << cpr::to_string(expected) << ", got " << cpr::to_string(e.kind())
            << " (" << e.what() << ")";
    }
}

// ============================================================================
// BASE TEST FIXTURE
// ============================================================================

class CodecTestBase : public ::testing::Test {
protected:
    // --- Data Factory Helpers ---

    /// Bytes whose value depends on position and @p seed, so blocks differ
    std::vector<uint8_t> makePattern(size_t size, uint8_t seed = 0) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>((i * 7 + seed * 31 + (i >> 8)) & 0xFF);
        }
        return data;
    }

    cpr::Block makeBlock(uint8_t seed) {
        return cpr::Block::fromBytes(makePattern(cpr::BLOCK_SIZE, seed));
    }

    cpr::Block makeFilledBlock(uint8_t value) {
        std::vector<uint8_t> data(cpr::BLOCK_SIZE, value);
        return cpr::Block::fromBytes(data);
    }

    cpr::Image makeImage(size_t count) {
        std::vector<cpr::Block> blocks;
        for (size_t i = 0; i < count; ++i) {
            blocks.push_back(makeBlock(static_cast<uint8_t>(i + 1)));
        }
        return cpr::Image(std::move(blocks));
    }

    /**
     * @brief Hand-assemble a CPR file, bypassing the encoder
     *
     * Each entry of @p ids becomes one chunk declaring @p declaredLength and
     * carrying a full 16384 byte slot. @p sizeField overrides the RIFF size.
     */
    std::vector<uint8_t> buildCpr(const std::vector<std::string>& ids,
                                  uint32_t declaredLength = cpr::BLOCK_SIZE,
                                  std::optional<uint32_t> sizeField = std::nullopt) {
        std::vector<uint8_t> out;
        appendTag(out, "RIFF");
        appendLong(out, 0);
        appendTag(out, "AMS!");
        for (size_t i = 0; i < ids.size(); ++i) {
            appendTag(out, ids[i]);
            appendLong(out, declaredLength);
            auto slot = makePattern(cpr::BLOCK_SIZE, static_cast<uint8_t>(i + 1));
            out.insert(out.end(), slot.begin(), slot.end());
        }
        uint32_t size = sizeField.value_or(static_cast<uint32_t>(out.size() - 8));
        for (int i = 0; i < 4; ++i) {
            out[4 + i] = static_cast<uint8_t>((size >> (i * 8)) & 0xFF);
        }
        return out;
    }

    std::vector<std::string> sequentialIds(size_t count) {
        std::vector<std::string> ids;
        for (size_t i = 0; i < count; ++i) {
            std::ostringstream oss;
            oss << "cb" << std::setw(2) << std::setfill('0') << i;
            ids.push_back(oss.str());
        }
        return ids;
    }

    /// Overwrite the RIFF size field with the actual length, after tampering
    void fixSizeField(std::vector<uint8_t>& cprFile) {
        uint32_t size = static_cast<uint32_t>(cprFile.size() - 8);
        for (int i = 0; i < 4; ++i) {
            cprFile[4 + i] = static_cast<uint8_t>((size >> (i * 8)) & 0xFF);
        }
    }
};

// ============================================================================
// SPECIALIZED TEST FIXTURES
// ============================================================================

class CprDecodeTest : public CodecTestBase {};
class CprEncodeTest : public CodecTestBase {};
class BinCodecTest : public CodecTestBase {};
class ImageTest : public CodecTestBase {};
class ByteStreamTest : public ::testing::Test {};

class ConvertFileTest : public CodecTestBase {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("cprconv_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path writeInput(const std::string& name, const std::vector<uint8_t>& bytes) {
        auto path = dir / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return path;
    }

    std::vector<uint8_t> textBytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    size_t countFiles() {
        return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                 std::filesystem::directory_iterator()));
    }
};
