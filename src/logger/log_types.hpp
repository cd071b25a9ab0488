#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - GateVerdict 를 직접 include 하지 않는다. 호출자가 필드를 복사해 채운다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// parse_log_level
//   "debug" | "info" | "warn" | "error" (대소문자 무관). 그 외는 nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ---------------------------------------------------------------------------
// DecisionLog
//   접근 판정 이벤트 로그.
//   matched_rule: 판정을 결정한 guard 식별자 ("default-allow" 포함)
//   remote_addr: REMOTE_ADDR (없으면 빈 문자열)
// ---------------------------------------------------------------------------
struct DecisionLog {
    bool                                  allowed{false};
    std::string                           matched_rule{};
    std::string                           reason{};
    std::string                           remote_addr{};
    std::string                           sapi_name{};
    std::chrono::system_clock::time_point timestamp{};
};
