#include <gtest/gtest.h>
#include "common/ferry_test_helpers.h"
#include <ferry/pipeline/pipeline_config.h>

#include <cstdlib>
#include <fstream>

using namespace ferry;
using namespace ferry::config;
using namespace std::chrono_literals;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            saved_ = old;
        }
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (saved_) {
            ::setenv(name_, saved_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> saved_;
};

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::make_temp_dir("ferry-config-");
        path_ = dir_ / "config.toml";
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    void writeConfig(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

} // namespace

TEST_F(PipelineConfigTest, DefaultsMatchDocumentedValues) {
    PipelineConfig cfg;
    EXPECT_EQ(cfg.download.maxConcurrent, 3u);
    EXPECT_EQ(cfg.policy.maxInlineMb, 2048u);
    EXPECT_EQ(cfg.inlineThresholdBytes(), 2048ull * MiB);
    EXPECT_EQ(cfg.session.ttl, 900s);
    EXPECT_EQ(cfg.progress.minInterval, 2000ms);
    EXPECT_DOUBLE_EQ(cfg.progress.minPercentDelta, 10.0);
    EXPECT_EQ(cfg.upload.maxAttempts, 3);
    EXPECT_EQ(cfg.upload.initialBackoff, 1000ms);
    EXPECT_EQ(cfg.upload.endpoints, (std::vector<std::string>{"https://upload.gofile.io"}));
    EXPECT_TRUE(validate(cfg));
}

TEST_F(PipelineConfigTest, FileValuesOverrideDefaults) {
    writeConfig("[download]\nmax_concurrent = 6\n"
                "[policy]\nmax_inline_mb = 20\nforce_offload = true\n"
                "[upload]\nendpoints = \"https://a.example,https://b.example\"\n"
                "max_attempts = 5\nbackoff_multiplier = 1.5\n"
                "[log]\nlevel = \"debug\"\n");

    PipelineConfig cfg;
    ASSERT_TRUE(applyFileSettings(cfg, path_));
    EXPECT_EQ(cfg.download.maxConcurrent, 6u);
    EXPECT_EQ(cfg.inlineThresholdBytes(), 20ull * MiB);
    EXPECT_TRUE(cfg.policy.forceOffload);
    EXPECT_EQ(cfg.upload.endpoints.size(), 2u);
    EXPECT_EQ(cfg.upload.maxAttempts, 5);
    EXPECT_DOUBLE_EQ(cfg.upload.backoffMultiplier, 1.5);
    EXPECT_EQ(cfg.log.level, "debug");
}

TEST_F(PipelineConfigTest, InvalidNumbersKeepPreviousValue) {
    writeConfig("[download]\nmax_concurrent = lots\n[upload]\nmax_backoff_ms = -5\n");
    PipelineConfig cfg;
    ASSERT_TRUE(applyFileSettings(cfg, path_));
    EXPECT_EQ(cfg.download.maxConcurrent, 3u);
    EXPECT_EQ(cfg.upload.maxBackoff, 30000ms);
}

TEST_F(PipelineConfigTest, PrecedenceIsCliOverEnvOverFile) {
    writeConfig("[policy]\nmax_inline_mb = 20\n[log]\nlevel = \"warn\"\n"
                "[download]\nmax_concurrent = 4\n");
    ScopedEnv size("FERRY_MAX_DOWNLOAD_SIZE", "50");
    ScopedEnv level("FERRY_LOG_LEVEL", "info");

    CommandLineOverrides cli;
    cli.logLevel = "trace";

    auto loaded = loadPipelineConfig(path_.string(), cli);
    ASSERT_TRUE(loaded);
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.policy.maxInlineMb, 50u);  // env beats file
    EXPECT_EQ(cfg.log.level, "trace");        // cli beats env
    EXPECT_EQ(cfg.download.maxConcurrent, 4u); // file beats default
}

TEST_F(PipelineConfigTest, ExplicitMissingConfigFails) {
    auto loaded = loadPipelineConfig((dir_ / "absent.toml").string());
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::FileNotFound);
}

TEST_F(PipelineConfigTest, ValidateRejectsImpossibleSettings) {
    PipelineConfig cfg;
    cfg.download.maxConcurrent = 0;
    EXPECT_EQ(validate(cfg).error().code, ErrorCode::InvalidArgument);

    cfg = PipelineConfig{};
    cfg.upload.endpoints.clear();
    EXPECT_EQ(validate(cfg).error().code, ErrorCode::InvalidArgument);

    cfg = PipelineConfig{};
    cfg.upload.maxAttempts = 0;
    EXPECT_EQ(validate(cfg).error().code, ErrorCode::InvalidArgument);

    cfg = PipelineConfig{};
    cfg.upload.chunkSizeBytes = 0;
    EXPECT_EQ(validate(cfg).error().code, ErrorCode::InvalidArgument);
}
