// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ostringstream 으로 출력을 받는 로거
// ---------------------------------------------------------------------------
struct CapturedLogger {
    explicit CapturedLogger(LogLevel level)
        : sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream, true))
        , logger(level, sink) {}

    std::ostringstream                               stream;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt>  sink;
    StructuredLogger                                 logger;
};

DecisionLog make_entry(bool allowed) {
    DecisionLog entry{};
    entry.allowed      = allowed;
    entry.matched_rule = allowed ? "default-allow" : "remote-addr";
    entry.reason       = allowed ? "all checks passed" : "remote address '203.0.113.5' not in allowlist";
    entry.remote_addr  = allowed ? "127.0.0.1" : "203.0.113.5";
    entry.sapi_name    = "fpm-fcgi";
    // 2024-01-02T03:04:05.678Z
    entry.timestamp = std::chrono::system_clock::time_point{
        std::chrono::milliseconds{1704164645678}};
    return entry;
}

}  // namespace

TEST(ParseLogLevel, KnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::kError);
}

TEST(ParseLogLevel, UnknownName_ReturnsNullopt) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(StructuredLogger, LogDecision_Deny_WritesJson) {
    CapturedLogger cap(LogLevel::kDebug);
    cap.logger.log_decision(make_entry(false));

    const std::string out = cap.stream.str();
    EXPECT_NE(out.find(R"("event":"access_decision")"), std::string::npos) << out;
    EXPECT_NE(out.find(R"("allowed":false)"), std::string::npos) << out;
    EXPECT_NE(out.find(R"("matched_rule":"remote-addr")"), std::string::npos) << out;
    EXPECT_NE(out.find(R"("remote_addr":"203.0.113.5")"), std::string::npos) << out;
    EXPECT_NE(out.find(R"("sapi_name":"fpm-fcgi")"), std::string::npos) << out;
    EXPECT_NE(out.find(R"("timestamp":"2024-01-02T03:04:05.678Z")"), std::string::npos) << out;
}

TEST(StructuredLogger, LogDecision_Allow_WritesJson) {
    CapturedLogger cap(LogLevel::kInfo);
    cap.logger.log_decision(make_entry(true));

    const std::string out = cap.stream.str();
    EXPECT_NE(out.find(R"("allowed":true)"), std::string::npos) << out;
    EXPECT_NE(out.find(R"("matched_rule":"default-allow")"), std::string::npos) << out;
}

TEST(StructuredLogger, LogDecision_WarnLevel_SuppressesAllow) {
    CapturedLogger cap(LogLevel::kWarn);
    cap.logger.log_decision(make_entry(true));
    EXPECT_TRUE(cap.stream.str().empty());

    cap.logger.log_decision(make_entry(false));
    EXPECT_FALSE(cap.stream.str().empty());
}

TEST(StructuredLogger, LogDecision_ErrorLevel_SuppressesDeny) {
    CapturedLogger cap(LogLevel::kError);
    cap.logger.log_decision(make_entry(false));
    EXPECT_TRUE(cap.stream.str().empty());
}

TEST(StructuredLogger, LogDecision_EscapesQuotes) {
    CapturedLogger cap(LogLevel::kDebug);
    auto entry   = make_entry(false);
    entry.reason = "say \"hi\"\n";
    cap.logger.log_decision(entry);

    const std::string out = cap.stream.str();
    EXPECT_NE(out.find(R"("reason":"say \"hi\"\n")"), std::string::npos) << out;
}

TEST(StructuredLogger, DiagnosticWrappers_RespectLevel) {
    CapturedLogger cap(LogLevel::kInfo);
    cap.logger.debug("hidden-debug");
    cap.logger.info("visible-info");
    cap.logger.error("visible-error");

    const std::string out = cap.stream.str();
    EXPECT_EQ(out.find("hidden-debug"), std::string::npos);
    EXPECT_NE(out.find("visible-info"), std::string::npos);
    EXPECT_NE(out.find("visible-error"), std::string::npos);
}
