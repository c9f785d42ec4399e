#include <catch2/catch_test_macros.hpp>
#include "lucid/debug/pipeline_logger.hpp"
#include <string>
#include <vector>
using namespace lucid::debug;

namespace {

struct Captured {
    LogLevel level;
    std::string component;
    std::string message;
};

/// Installs a capturing sink and restores stderr and the level on exit.
class CapturingSink {
public:
    CapturingSink()
        : previous_level_(GetLogLevel()) {
        SetLogSink([this](LogLevel level, std::string_view component, std::string_view message) {
            lines_.push_back(Captured{level, std::string(component), std::string(message)});
        });
    }

    ~CapturingSink() {
        SetLogSink({});
        SetLogLevel(previous_level_);
    }

    [[nodiscard]] const std::vector<Captured>& Lines() const noexcept { return lines_; }

private:
    LogLevel previous_level_;
    std::vector<Captured> lines_;
};

}

TEST_CASE("PipelineLogger - Level Filtering", "[debug][logging]") {
    CapturingSink sink;
    SetLogLevel(LogLevel::Warn);

    LUCID_LOG_DEBUG("test", "debug {}", 1);
    LUCID_LOG_INFO("test", "info {}", 2);
    LUCID_LOG_WARN("test", "warn {}", 3);
    LUCID_LOG_ERROR("test", "error {}", 4);

    REQUIRE(sink.Lines().size() == 2);
    REQUIRE(sink.Lines()[0].level == LogLevel::Warn);
    REQUIRE(sink.Lines()[0].message == "warn 3");
    REQUIRE(sink.Lines()[1].level == LogLevel::Error);
    REQUIRE(sink.Lines()[1].component == "test");
}

TEST_CASE("PipelineLogger - Off Silences Everything", "[debug][logging]") {
    CapturingSink sink;
    SetLogLevel(LogLevel::Off);
    LUCID_LOG_ERROR("test", "never shown");
    REQUIRE(sink.Lines().empty());
    REQUIRE_FALSE(IsEnabled(LogLevel::Error));
}

TEST_CASE("PipelineLogger - Arguments Are Not Formatted When Disabled", "[debug][logging]") {
    CapturingSink sink;
    SetLogLevel(LogLevel::Info);
    int evaluations = 0;
    auto counted = [&evaluations] { return ++evaluations; };
    LUCID_LOG_DEBUG("test", "value {}", counted());
    REQUIRE(evaluations == 0);
    LUCID_LOG_INFO("test", "value {}", counted());
    REQUIRE(evaluations == 1);
    REQUIRE(sink.Lines().back().message == "value 1");
}

TEST_CASE("PipelineLogger - Level Names", "[debug][logging]") {
    REQUIRE(std::string(LevelToString(LogLevel::Debug)) == "DEBUG");
    REQUIRE(std::string(LevelToString(LogLevel::Error)) == "ERROR");
}

TEST_CASE("PipelineLogger - Sink May Log Again", "[debug][logging]") {
    const LogLevel previous_level = GetLogLevel();
    SetLogLevel(LogLevel::Info);
    std::vector<std::string> messages;
    int depth = 0;
    SetLogSink([&messages, &depth](LogLevel, std::string_view component, std::string_view message) {
        messages.emplace_back(message);
        if (depth == 0 && component == "outer") {
            ++depth;
            LUCID_LOG_INFO("inner", "relayed '{}'", message);
            --depth;
        }
    });

    LUCID_LOG_INFO("outer", "first");

    SECTION("Nested line is delivered after the outer one") {
        REQUIRE(messages == std::vector<std::string>{"first", "relayed 'first'"});
    }
    SECTION("Sink can replace itself while running") {
        std::vector<std::string> replaced;
        SetLogSink([&replaced](LogLevel level, std::string_view, std::string_view message) {
            replaced.emplace_back(message);
            if (level == LogLevel::Warn) {
                SetLogSink([&replaced](LogLevel, std::string_view, std::string_view inner) {
                    replaced.emplace_back("after: " + std::string(inner));
                });
            }
        });
        LUCID_LOG_WARN("outer", "swap");
        LUCID_LOG_INFO("outer", "next");
        REQUIRE(replaced == std::vector<std::string>{"swap", "after: next"});
    }

    SetLogSink({});
    SetLogLevel(previous_level);
}
