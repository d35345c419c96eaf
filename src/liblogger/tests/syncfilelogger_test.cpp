#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "espanso/syncfilelogger.hpp"

namespace fs = std::filesystem;

// Временный файл, удаляемый по выходу из области видимости
class TempFile {
public:
    explicit TempFile(const std::string& prefix = "test") {
        path_ = (fs::temp_directory_path() /
                 (prefix + "_" +
                  std::to_string(
                      std::chrono::system_clock::now().time_since_epoch().count()) +
                  ".log"))
                    .string();
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

static std::string readAll(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

class SyncFileLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mainLog_ = std::make_unique<TempFile>("main");
        fallbackLog_ = std::make_unique<TempFile>("fallback");
        logger_ = &espanso::SyncFileLogger::instance();
        logger_->setOpenMode(espanso::FileOpenMode::APPEND);
        logger_->setFallbackLogPath(fallbackLog_->path());
        logger_->setMainLogPath(mainLog_->path());
        logger_->init(espanso::LogLevel::LOG_INFO);
    }
    void TearDown() override { logger_->flush(); }

    std::unique_ptr<TempFile> mainLog_;
    std::unique_ptr<TempFile> fallbackLog_;
    espanso::SyncFileLogger* logger_;
};

TEST_F(SyncFileLoggerTest, WritesToMainFile) {
    const std::string message = "daemon lock acquired";
    logger_->info(message);
    EXPECT_NE(readAll(mainLog_->path()).find(message), std::string::npos);
}

TEST_F(SyncFileLoggerTest, FallbackWhenMainDirectoryIsMissing) {
    logger_->setMainLogPath("/nonexistent-espanso-dir/espanso.log");
    const std::string message = "Test message to fallback";
    logger_->info(message);
    EXPECT_NE(readAll(fallbackLog_->path()).find(message), std::string::npos);
}

TEST_F(SyncFileLoggerTest, SkipsLowerLevel) {
    logger_->setLogLevel(espanso::LogLevel::LOG_WARNING);
    logger_->info("This should not appear");
    EXPECT_EQ(readAll(mainLog_->path()).find("This should not appear"),
              std::string::npos);
}

TEST_F(SyncFileLoggerTest, CleanAndAppendTruncatesPreviousSession) {
    TempFile sessionLog("session");
    { std::ofstream(sessionLog.path()) << "previous session line\n"; }

    logger_->setOpenMode(espanso::FileOpenMode::CLEAN_AND_APPEND);
    logger_->setMainLogPath(sessionLog.path());
    logger_->info("first line of new session");
    logger_->info("second line of new session");
    logger_->setOpenMode(espanso::FileOpenMode::APPEND);

    std::string content = readAll(sessionLog.path());
    EXPECT_EQ(content.find("previous session line"), std::string::npos);
    EXPECT_NE(content.find("first line of new session"), std::string::npos);
    EXPECT_NE(content.find("second line of new session"), std::string::npos);
}

TEST_F(SyncFileLoggerTest, SizeRotationArchivesOldFile) {
    espanso::RotationConfig config;
    config.enabled = true;
    config.type = espanso::RotationType::SIZE;
    config.maxFileSizeBytes = 64;
    logger_->setRotationConfig(config);

    for (int i = 0; i < 5; ++i) {
        logger_->info("rotation line " + std::to_string(i));
    }
    logger_->setRotationConfig(espanso::RotationConfig{});

    EXPECT_TRUE(fs::exists(mainLog_->path() + ".1"));
    fs::remove(mainLog_->path() + ".1");
}

TEST_F(SyncFileLoggerTest, HandlesEmptyMessage) {
    EXPECT_NO_THROW(logger_->info(""));
}
