// EN: Unit tests for file kind detection and validator dispatch
// FR: Tests unitaires de la détection du type de fichier et de l'aiguillage des validateurs

#include <gtest/gtest.h>
#include "validation/file_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace FP;
using namespace FP::Validation;

class FileValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() / "fp_file_validator_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = (test_dir_ / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileValidatorTest, DetectsKindFromExtension) {
    EXPECT_EQ(detectFileKind("data.json"), FileKind::JSON);
    EXPECT_EQ(detectFileKind("/tmp/DATA.JSON"), FileKind::JSON);
    EXPECT_EQ(detectFileKind("export.Json.gz"), FileKind::JSON);
    EXPECT_EQ(detectFileKind("data.csv"), FileKind::DELIMITED);
    EXPECT_EQ(detectFileKind("data.csv.gz"), FileKind::DELIMITED);
    EXPECT_EQ(detectFileKind("notes.txt"), FileKind::DELIMITED);
    EXPECT_EQ(detectFileKind("no_extension"), FileKind::DELIMITED);
    EXPECT_EQ(detectFileKind("json"), FileKind::DELIMITED);
}

TEST_F(FileValidatorTest, AutoDispatchFollowsTheExtension) {
    ValidationSettings settings;

    auto json_report = validateFile(writeFile("rows.json", R"([{"a":1},{"a":2}])"), settings);
    EXPECT_EQ(json_report.file_type, "JSON");
    EXPECT_EQ(json_report.total_rows, 2u);

    auto csv_report = validateFile(writeFile("rows.csv", "a,b\n1,2\n"), settings);
    EXPECT_EQ(csv_report.file_type, "Delimited (delimiter: ,)");
    EXPECT_TRUE(csv_report.passed);
}

TEST_F(FileValidatorTest, ExplicitKindOverridesTheExtension) {
    auto path = writeFile("payload.txt", R"({"id": 7, "name": "x"})");

    ValidationSettings settings;
    settings.kind = FileKind::JSON;
    auto report = validateFile(path, settings);
    EXPECT_EQ(report.file_type, "JSON");
    EXPECT_EQ(report.expected_columns, 2u);
    EXPECT_TRUE(report.passed);
}

TEST_F(FileValidatorTest, SettingsReachTheValidator) {
    auto path = writeFile("pinned.csv", "a|b;c\n1|2;3\n");

    ValidationSettings settings;
    settings.delimited.delimiter = ';';
    auto report = validateFile(path, settings);
    EXPECT_EQ(report.delimiter, ";");
    EXPECT_FALSE(report.delimiter_detected);
    EXPECT_EQ(report.expected_columns, 2u);
}
