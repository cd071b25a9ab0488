#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 기본 sink 는 stderr 이다. CGI 모드에서 stdout 은 HTTP 응답이므로
//   진단 출력이 섞이면 안 된다.
// - 테스트에서는 sink 를 직접 주입한다 (ostream_sink 등).
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <memory>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   sink      : nullptr 이면 stderr sink 를 생성한다.
    //
    //   spdlog 초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level, spdlog::sink_ptr sink = nullptr);

    ~StructuredLogger() = default;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_decision
    //   접근 판정 결과를 JSON 으로 기록한다.
    //   거부는 warn, 허용은 info 레벨.
    void log_decision(const DecisionLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // spdlog 기본 로거를 이 로거로 교체한다.
    // settings_loader 등 free spdlog:: 호출도 같은 sink/level 로 출력된다.
    void install_as_default();

private:
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    LogLevel                        min_level_;
    std::shared_ptr<spdlog::logger> logger_;
};
