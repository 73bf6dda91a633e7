// EN: Unit tests for ValidationJob - worker lifecycle, progress snapshots and cancellation
// FR: Tests unitaires de ValidationJob - cycle de vie du worker, instantanés de progression et annulation

#include <gtest/gtest.h>
#include "orchestrator/validation_job.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace FP;
using namespace FP::Orchestrator;
using namespace FP::Validation;

class ValidationJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() / "fp_validation_job_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string writeRows(const std::string& name, size_t rows) {
        auto path = (test_dir_ / name).string();
        std::ofstream out(path);
        out << "id,value\n";
        for (size_t i = 1; i < rows; ++i) {
            out << i << ",v\n";
        }
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ValidationJobTest, RunsToCompletion) {
    ValidationSettings settings;
    settings.delimited.progress_interval = 100;
    ValidationJob job(writeRows("complete.csv", 1000), settings);

    EXPECT_FALSE(job.isRunning());
    job.start();
    auto report = job.wait();

    EXPECT_FALSE(job.isRunning());
    EXPECT_TRUE(report.passed);
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(report.total_rows, 1000u);

    auto progress = job.latestProgress();
    EXPECT_DOUBLE_EQ(progress.percent, 100.0);
    EXPECT_EQ(progress.rows_processed, 1000u);
    EXPECT_EQ(progress.updates, 11u);
}

TEST_F(ValidationJobTest, ListenerSeesEveryUpdateInOrder) {
    ValidationSettings settings;
    settings.delimited.progress_interval = 250;
    ValidationJob job(writeRows("listener.csv", 1000), settings);

    std::vector<size_t> rows_seen;
    job.setProgressListener([&rows_seen](const ProgressSnapshot& snapshot) {
        rows_seen.push_back(snapshot.rows_processed);
    });
    job.start();
    job.wait();

    EXPECT_EQ(rows_seen, (std::vector<size_t>{250, 500, 750, 1000, 1000}));
    EXPECT_THROW(job.setProgressListener(nullptr), std::logic_error);
}

TEST_F(ValidationJobTest, CancelFromListenerKeepsPartialReport) {
    ValidationSettings settings;
    settings.delimited.progress_interval = 100;
    ValidationJob job(writeRows("cancel.csv", 10000), settings);

    job.setProgressListener([&job](const ProgressSnapshot& snapshot) {
        if (snapshot.rows_processed >= 500) {
            job.cancel();
        }
    });
    job.start();
    auto report = job.wait();

    EXPECT_TRUE(job.isCancelRequested());
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.total_rows, 500u);
    EXPECT_EQ(job.latestProgress().rows_processed, 500u);
}

TEST_F(ValidationJobTest, CancelBeforeStartStopsImmediately) {
    ValidationJob job(writeRows("early.csv", 10), ValidationSettings{});
    job.cancel();
    job.cancel();
    job.start();
    auto report = job.wait();

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.total_rows, 0u);
}

TEST_F(ValidationJobTest, MissingFileEndsWithReadError) {
    ValidationJob job((test_dir_ / "absent.csv").string(), ValidationSettings{});
    job.start();
    auto report = job.wait();

    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].kind, IssueKind::FILE_READ_ERROR);
    EXPECT_FALSE(report.passed);
}

TEST_F(ValidationJobTest, WorkerExceptionIsRethrownByWait) {
    ValidationSettings settings;
    settings.delimited.max_errors = 0;
    ValidationJob job(writeRows("bad_settings.csv", 5), settings);
    job.start();
    EXPECT_THROW(job.wait(), std::invalid_argument);
}

TEST_F(ValidationJobTest, LifecycleMisuseIsRejected) {
    ValidationJob job(writeRows("misuse.csv", 5), ValidationSettings{});
    EXPECT_THROW(job.wait(), std::logic_error);

    job.start();
    EXPECT_THROW(job.start(), std::logic_error);
    job.wait();
}

TEST_F(ValidationJobTest, DestructorCancelsARunningWorker) {
    auto path = writeRows("destructor.csv", 200000);
    {
        ValidationJob job(path, ValidationSettings{});
        job.start();
    }
    SUCCEED();
}

TEST_F(ValidationJobTest, JsonFilesGoToTheJsonValidator) {
    auto path = (test_dir_ / "rows.json").string();
    {
        std::ofstream out(path);
        out << R"([{"a":1},{"b":2}])";
    }

    ValidationJob job(path, ValidationSettings{});
    job.start();
    auto report = job.wait();

    EXPECT_EQ(report.file_type, "JSON");
    EXPECT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(job.latestProgress().updates, 2u);
}
