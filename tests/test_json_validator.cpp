// EN: Unit tests for JsonValidator - parse errors, array schema drift, top-level shapes
// FR: Tests unitaires de JsonValidator - erreurs d'analyse, dérive de schéma, formes de premier niveau

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "validation/json_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <tuple>
#include <vector>

using namespace FP;
using namespace FP::Validation;
using ::testing::HasSubstr;

class JsonValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() / "fp_json_validator_test";
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

TEST_F(JsonValidatorTest, MalformedDocumentYieldsOneParseError) {
    auto path = writeFile("bad.json", "{invalid");
    auto report = validateJson(path);

    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::JSON_PARSE_ERROR);
    EXPECT_EQ(report.errors()[0].row, 1u);
    EXPECT_THAT(report.errors()[0].description, HasSubstr("Invalid JSON: "));
    EXPECT_EQ(report.invalid_rows, 1u);
    EXPECT_FALSE(report.passed);
    EXPECT_EQ(report.file_type, "JSON");
}

TEST_F(JsonValidatorTest, ParseErrorReportsTheLine) {
    auto path = writeFile("multiline.json", "[\n1,\n2,,\n3\n]");
    auto report = validateJson(path);

    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].row, 3u);
}

TEST_F(JsonValidatorTest, NumberOverflowIsAParseErrorNotAReadError) {
    auto report = validateJson(writeFile("overflow.json", "[1e999]"));

    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::JSON_PARSE_ERROR);
    EXPECT_EQ(report.errors()[0].row, 1u);
    EXPECT_THAT(report.errors()[0].description, HasSubstr("Invalid JSON: "));
    EXPECT_THAT(report.errors()[0].description, HasSubstr("number overflow"));
    EXPECT_EQ(report.invalid_rows, 1u);
    EXPECT_EQ(report.total_rows, 0u);
    EXPECT_FALSE(report.passed);
}

TEST_F(JsonValidatorTest, LineOfByteCountsPrecedingNewlines) {
    std::string content = "ab\ncd\nef";
    EXPECT_EQ(JsonValidator::lineOfByte(content, 0), 1u);
    EXPECT_EQ(JsonValidator::lineOfByte(content, 3), 1u);
    EXPECT_EQ(JsonValidator::lineOfByte(content, 5), 2u);
    EXPECT_EQ(JsonValidator::lineOfByte(content, 100), 3u);
}

TEST_F(JsonValidatorTest, ExtraKeyIsAWarningOnly) {
    auto path = writeFile("drift.json", R"([{"a":1},{"a":1,"b":2}])");
    auto report = validateJson(path);

    EXPECT_TRUE(report.errors().empty());
    ASSERT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(report.warnings()[0].kind, IssueKind::KEY_MISMATCH);
    EXPECT_EQ(report.warnings()[0].row, 2u);
    EXPECT_EQ(report.warnings()[0].description, "Extra keys: b");
    EXPECT_EQ(report.total_rows, 2u);
    EXPECT_EQ(report.valid_rows, 2u);
    EXPECT_EQ(report.expected_columns, 1u);
    EXPECT_TRUE(report.passed);
}

TEST_F(JsonValidatorTest, MissingAndExtraKeysAreSorted) {
    auto path = writeFile("keys.json", R"([{"z":1,"a":2,"m":3},{"m":1,"y":2,"b":3}])");
    auto report = validateJson(path);

    ASSERT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(report.warnings()[0].description, "Missing keys: a, z; Extra keys: b, y");
}

TEST_F(JsonValidatorTest, NonObjectElementIsATypeMismatch) {
    auto path = writeFile("mixed.json", R"([{"a":1},[1,2],{"a":3},"text"])");
    auto report = validateJson(path);

    ASSERT_EQ(report.errors().size(), 2u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::TYPE_MISMATCH);
    EXPECT_EQ(report.errors()[0].row, 2u);
    EXPECT_EQ(report.errors()[0].description, "Expected object, got array");
    EXPECT_EQ(report.errors()[1].row, 4u);
    EXPECT_EQ(report.errors()[1].description, "Expected object, got string");
    EXPECT_EQ(report.total_rows, 4u);
    EXPECT_EQ(report.valid_rows, 2u);
    EXPECT_EQ(report.invalid_rows, 2u);
    EXPECT_FALSE(report.passed);
}

TEST_F(JsonValidatorTest, ArrayOfScalarsHasNoSchema) {
    auto path = writeFile("numbers.json", "[1, 2, 3]");
    auto report = validateJson(path);

    EXPECT_EQ(report.total_rows, 3u);
    EXPECT_EQ(report.valid_rows, 3u);
    EXPECT_EQ(report.expected_columns, 0u);
    EXPECT_TRUE(report.passed);
}

TEST_F(JsonValidatorTest, SingleObjectAndScalarDocuments) {
    auto object_report = validateJson(writeFile("object.json", R"({"name":"x","size":3,"tags":[]})"));
    EXPECT_EQ(object_report.total_rows, 1u);
    EXPECT_EQ(object_report.valid_rows, 1u);
    EXPECT_EQ(object_report.expected_columns, 3u);
    EXPECT_TRUE(object_report.passed);

    auto scalar_report = validateJson(writeFile("scalar.json", "42"));
    EXPECT_EQ(scalar_report.total_rows, 1u);
    EXPECT_TRUE(scalar_report.passed);

    auto empty_array = validateJson(writeFile("empty_array.json", "[]"));
    EXPECT_EQ(empty_array.total_rows, 0u);
    EXPECT_TRUE(empty_array.passed);
}

TEST_F(JsonValidatorTest, InvalidUtf8IsAParseError) {
    auto report = validateJson(writeFile("latin1.json", "{\"name\": \"caf\xE9\"}"));
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::JSON_PARSE_ERROR);
}

TEST_F(JsonValidatorTest, GzipDocumentIsAccepted) {
    auto path = (test_dir_ / "doc.json.gz").string();
    std::string content = R"([{"a":1},{"a":2}])";
    gzFile gz = gzopen(path.c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    gzclose(gz);

    auto report = validateJson(path);
    EXPECT_EQ(report.total_rows, 2u);
    EXPECT_TRUE(report.passed);
}

TEST_F(JsonValidatorTest, ProgressFiresAtFixedPoints) {
    auto path = writeFile("progress.json", R"([{"a":1},{"b":1},7])");
    std::vector<std::tuple<double, size_t, size_t>> calls;
    JsonValidator validator;
    auto report = validator.validate(path, nullptr, [&calls](double percent, size_t rows, size_t errors) {
        calls.emplace_back(percent, rows, errors);
    });

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_DOUBLE_EQ(std::get<0>(calls[0]), 50.0);
    EXPECT_EQ(std::get<1>(calls[0]), 0u);
    EXPECT_DOUBLE_EQ(std::get<0>(calls[1]), 100.0);
    EXPECT_EQ(std::get<1>(calls[1]), 3u);
    EXPECT_EQ(std::get<2>(calls[1]), 1u);
    EXPECT_EQ(validator.getState(), ValidatorState::COMPLETE);
}

TEST_F(JsonValidatorTest, CancellationStopsBeforeProcessing) {
    auto path = writeFile("cancel.json", R"([{"a":1},[],[],[]])");
    CancellationFlag cancel{false};
    JsonValidator validator;
    auto report = validator.validate(path, &cancel, [&cancel](double percent, size_t, size_t) {
        if (percent < 100.0) {
            cancel.store(true);
        }
    });

    EXPECT_TRUE(report.cancelled);
    EXPECT_TRUE(report.errors().empty());
    EXPECT_EQ(validator.getState(), ValidatorState::CANCELLED);
}

TEST_F(JsonValidatorTest, CancellationMidArrayKeepsEarlierFindings) {
    auto path = writeFile("cancel_mid.json", R"([{"a":1},{"b":1},7,8,9,10])");
    CancellationFlag cancel{false};
    std::vector<size_t> visited;

    JsonValidatorOptions options;
    options.element_listener = [&cancel, &visited](size_t index) {
        visited.push_back(index);
        if (index == 4) {
            cancel.store(true);
        }
    };
    JsonValidator validator(options);

    std::vector<double> percents;
    auto report = validator.validate(path, &cancel, [&percents](double percent, size_t, size_t) {
        percents.push_back(percent);
    });

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(validator.getState(), ValidatorState::CANCELLED);
    EXPECT_EQ(visited, (std::vector<size_t>{2, 3, 4}));

    ASSERT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(report.warnings()[0].kind, IssueKind::KEY_MISMATCH);
    EXPECT_EQ(report.warnings()[0].row, 2u);
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::TYPE_MISMATCH);
    EXPECT_EQ(report.errors()[0].row, 3u);
    EXPECT_EQ(report.invalid_rows, 1u);

    // EN: No completion callback after a cancellation
    // FR: Pas de callback de fin après une annulation
    EXPECT_EQ(percents, (std::vector<double>{50.0}));
}

TEST_F(JsonValidatorTest, MissingFileIsAReadError) {
    auto report = validateJson((test_dir_ / "absent.json").string());

    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::FILE_READ_ERROR);
    EXPECT_EQ(report.errors()[0].row, 0u);
    EXPECT_THAT(report.errors()[0].description, HasSubstr("Error reading file: "));
    EXPECT_FALSE(report.passed);
}

TEST_F(JsonValidatorTest, ErrorCapIsRespected) {
    std::string content = "[{\"a\":1}";
    for (int i = 0; i < 20; ++i) {
        content += ",0";
    }
    content += "]";
    auto report = validateJson(writeFile("capped.json", content), 5);

    EXPECT_EQ(report.errors().size(), 5u);
    EXPECT_EQ(report.invalid_rows, 20u);
}

TEST_F(JsonValidatorTest, ZeroCapIsRejected) {
    JsonValidatorOptions options;
    options.max_errors = 0;
    EXPECT_THROW(JsonValidator validator(options), std::invalid_argument);
}
