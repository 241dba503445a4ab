#include <catch2/catch_test_macros.hpp>
#include <arbor/core/log.hpp>
#include <string>
#include <vector>

using namespace arbor::core;

namespace {

struct CaptureSink : ILogSink {
    std::vector<std::pair<LogLevel, std::string>> messages;

    void log(LogLevel level, const std::string& message) override {
        messages.emplace_back(level, message);
    }
};

} // namespace

TEST_CASE("Log sinks receive messages", "[core][log]") {
    CaptureSink sink;
    add_log_sink(&sink);
    set_log_level(LogLevel::Trace);

    SECTION("Plain message") {
        log(LogLevel::Info, "hello");
        REQUIRE(sink.messages.size() == 1);
        REQUIRE(sink.messages[0].first == LogLevel::Info);
        REQUIRE(sink.messages[0].second == "hello");
    }

    SECTION("Formatted message") {
        log(LogLevel::Debug, "{} trees advanced to stage {}", 3, 2);
        REQUIRE(sink.messages.size() == 1);
        REQUIRE(sink.messages[0].second == "3 trees advanced to stage 2");
    }

    remove_log_sink(&sink);
    set_log_level(LogLevel::Info);
}

TEST_CASE("Log level threshold filters messages", "[core][log]") {
    CaptureSink sink;
    add_log_sink(&sink);
    set_log_level(LogLevel::Warn);

    log(LogLevel::Info, "dropped");
    log(LogLevel::Debug, "also {}", "dropped");
    log(LogLevel::Error, "kept");

    REQUIRE(sink.messages.size() == 1);
    REQUIRE(sink.messages[0].second == "kept");

    remove_log_sink(&sink);
    set_log_level(LogLevel::Info);
}

TEST_CASE("Removed sink stops receiving", "[core][log]") {
    CaptureSink sink;
    add_log_sink(&sink);
    remove_log_sink(&sink);

    log(LogLevel::Error, "nobody listens");
    REQUIRE(sink.messages.empty());
}

TEST_CASE("Log level string round-trip", "[core][log]") {
    REQUIRE(log_level_from_string("debug") == LogLevel::Debug);
    REQUIRE(log_level_from_string("warn") == LogLevel::Warn);
    REQUIRE(log_level_from_string("bogus") == LogLevel::Info);
    REQUIRE(std::string(log_level_to_string(LogLevel::Error)) == "error");
}
