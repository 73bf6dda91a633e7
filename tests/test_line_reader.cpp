// EN: Unit tests for LineReader - plain and gzip input, buffer boundaries, rewind
// FR: Tests unitaires de LineReader - entrées brutes et gzip, limites de buffer, rembobinage

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "infrastructure/io/line_reader.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace FP;
using namespace FP::IO;

class LineReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() / "fp_line_reader_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string writePlain(const std::string& name, const std::string& content) {
        auto path = (test_dir_ / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::string writeGzip(const std::string& name, const std::string& content) {
        auto path = (test_dir_ / name).string();
        gzFile gz = gzopen(path.c_str(), "wb");
        EXPECT_NE(gz, nullptr);
        EXPECT_EQ(gzwrite(gz, content.data(), static_cast<unsigned>(content.size())),
                  static_cast<int>(content.size()));
        gzclose(gz);
        return path;
    }

    static std::vector<std::string> readAllLines(LineReader& reader) {
        std::vector<std::string> lines;
        std::string line;
        while (reader.readLine(line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path test_dir_;
};

TEST_F(LineReaderTest, ReadsLinesWithTerminators) {
    auto path = writePlain("plain.csv", "a,b\r\nc,d\n\nlast");
    LineReader reader(path);

    EXPECT_FALSE(reader.isCompressed());
    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre("a,b\r\n", "c,d\n", "\n", "last"));
    EXPECT_EQ(reader.bytesConsumed(), 14u);
}

TEST_F(LineReaderTest, BareCarriageReturnEndsALine) {
    auto path = writePlain("mac.csv", "a,b,c\r1,2,3\r\r4,5,6\r");
    LineReader reader(path);

    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre("a,b,c\r", "1,2,3\r", "\r", "4,5,6\r"));
    EXPECT_EQ(reader.bytesConsumed(), 19u);
}

TEST_F(LineReaderTest, MixedTerminatorsAreEachOneLine) {
    auto path = writePlain("mixed.csv", "a\rb\r\nc\nd");
    LineReader reader(path);

    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre("a\r", "b\r\n", "c\n", "d"));
}

TEST_F(LineReaderTest, CrlfSplitAcrossRefillsIsOneTerminator) {
    // EN: With a 4-byte buffer the CR lands on the last byte of the first fill
    // FR: Avec un buffer de 4 octets le CR tombe sur le dernier octet du premier remplissage
    auto path = writePlain("split.csv", "abc\r\nd\r\nf");
    LineReader reader(path, 4);

    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre("abc\r", "d\r\n", "f"));
    EXPECT_EQ(reader.bytesConsumed(), 9u);

    reader.rewind();
    std::string line;
    ASSERT_TRUE(reader.readLine(line));
    EXPECT_EQ(line, "abc\r");
    EXPECT_EQ(reader.readAll(), "d\r\nf");
}

TEST_F(LineReaderTest, LinesLongerThanTheBufferAreJoined) {
    std::string long_line(1000, 'x');
    auto path = writePlain("long.csv", long_line + "\nshort\n");
    LineReader reader(path, 7);

    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre(long_line + "\n", "short\n"));
}

TEST_F(LineReaderTest, RewindRestartsFromTheFirstLine) {
    auto path = writePlain("rewind.csv", "h1,h2\n1,2\n3,4\n");
    LineReader reader(path, 4);

    std::string line;
    ASSERT_TRUE(reader.readLine(line));
    ASSERT_TRUE(reader.readLine(line));
    EXPECT_EQ(line, "1,2\n");

    reader.rewind();
    EXPECT_EQ(reader.bytesConsumed(), 0u);
    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre("h1,h2\n", "1,2\n", "3,4\n"));
}

TEST_F(LineReaderTest, ReadsGzipTransparently) {
    auto path = writeGzip("data.csv.gz", "x,y\n1,2\n3,4\n");
    LineReader reader(path);

    EXPECT_TRUE(reader.isCompressed());
    EXPECT_THAT(readAllLines(reader), ::testing::ElementsAre("x,y\n", "1,2\n", "3,4\n"));
    EXPECT_LE(reader.bytesConsumed(), LineReader::getFileSize(path));
}

TEST_F(LineReaderTest, ReadAllReturnsRemainingContent) {
    auto path = writePlain("doc.json", "{\"a\": 1}\n[1, 2]");
    LineReader reader(path, 3);

    std::string first;
    ASSERT_TRUE(reader.readLine(first));
    EXPECT_EQ(reader.readAll(), "[1, 2]");

    reader.rewind();
    EXPECT_EQ(reader.readAll(), "{\"a\": 1}\n[1, 2]");
}

TEST_F(LineReaderTest, EmptyFileHasNoLines) {
    auto path = writePlain("empty.csv", "");
    LineReader reader(path);

    std::string line;
    EXPECT_FALSE(reader.readLine(line));
    EXPECT_TRUE(line.empty());
    EXPECT_EQ(LineReader::getFileSize(path), 0u);
}

TEST_F(LineReaderTest, MissingFileThrows) {
    auto missing = (test_dir_ / "missing.csv").string();
    EXPECT_THROW(LineReader reader(missing), std::runtime_error);
    EXPECT_THROW(LineReader::getFileSize(missing), std::runtime_error);
}

TEST_F(LineReaderTest, ZeroBufferIsRejected) {
    auto path = writePlain("zero.csv", "a\n");
    EXPECT_THROW(LineReader reader(path, 0), std::invalid_argument);
}

TEST_F(LineReaderTest, TruncatedGzipThrowsOnRead) {
    std::string content;
    for (int i = 0; i < 2000; ++i) {
        content += "row" + std::to_string(i) + ",value" + std::to_string(i * 7) + "\n";
    }
    auto full = writeGzip("full.csv.gz", content);

    std::ifstream in(full, std::ios::binary);
    std::string compressed((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto truncated = writePlain("truncated.csv.gz", compressed.substr(0, compressed.size() / 2));

    LineReader reader(truncated);
    std::string line;
    EXPECT_THROW({
        while (reader.readLine(line)) {
        }
    }, std::runtime_error);
}
