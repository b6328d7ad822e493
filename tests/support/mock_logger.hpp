#pragma once

/// @file mock_logger.hpp
/// @brief Recording log sink and a fixture that routes GameLogger into it.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "sgc/foundation/game_logger.hpp"

namespace sgc::test {

namespace kci = kcenon::common::interfaces;
using kci::log_level;

struct LogRecord {
    log_level level;
    std::string message;
};

/// Keeps every line it receives.  Thread-safe so concurrent writers can
/// be counted.
class MockLogger : public kci::ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        return store(level, message);
    }

    kcenon::common::VoidResult log(log_level level, std::string_view message,
                                   const kci::source_location& /*where*/) override {
        return store(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return store(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override { return ok(); }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        flushed_ = true;
        return ok();
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    bool wasFlushed() const {
        std::lock_guard lock(mutex_);
        return flushed_;
    }

    /// True if any line contains @p text.
    bool contains(std::string_view text) const {
        std::lock_guard lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [text](const LogRecord& r) {
            return r.message.find(text) != std::string::npos;
        });
    }

    /// Lines written under @p category ("[Combat] ...").
    std::vector<std::string> linesIn(foundation::LogCategory category) const {
        const std::string prefix = "[" + std::string(foundation::logCategoryName(category)) + "]";
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        for (const auto& r : records_) {
            if (r.message.rfind(prefix, 0) == 0) {
                out.push_back(r.message);
            }
        }
        return out;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        records_.clear();
        flushed_ = false;
    }

private:
    static kcenon::common::VoidResult ok() {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult store(log_level level, std::string message) {
        std::lock_guard lock(mutex_);
        records_.push_back({level, std::move(message)});
        return ok();
    }

    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    bool flushed_ = false;
};

/// Installs a MockLogger as the registry default and puts the shared
/// GameLogger back on its default levels around each test.
class MockLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
        foundation::GameLogger::instance().resetLevels();
    }

    void TearDown() override {
        foundation::GameLogger::instance().resetLevels();
        kci::GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

} // namespace sgc::test
