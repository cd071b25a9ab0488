#pragma once

#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// RequestContext
//   요청 하나의 접근 판정에 필요한 신호만 담은 불변 스냅샷.
//   front-controller 레이어가 요청마다 생성하고 gate 레이어에 const-ref 로
//   전달한다. 판정 후 폐기된다.
// ---------------------------------------------------------------------------
struct RequestContext {
    bool                       has_client_ip_header{false};      // HTTP_CLIENT_IP 존재 여부
    bool                       has_forwarded_for_header{false};  // HTTP_X_FORWARDED_FOR 존재 여부
    std::optional<std::string> remote_addr{};                    // REMOTE_ADDR (없으면 nullopt)
    std::string                sapi_name{};                      // 실행 모드 (예: "fpm-fcgi")
};

// ---------------------------------------------------------------------------
// ConfigErrorCode
//   설정 파일 로드 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kNotFound   = 0,  // 검색 디렉터리 어디에도 파일이 없음
    kUnreadable = 1,  // 파일은 있으나 읽기 실패
    kParseError = 2,  // YAML 문법 오류
};

// ---------------------------------------------------------------------------
// ConfigError
//   로드 실패 시 반환되는 오류 정보.
//   std::expected<T, ConfigError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kNotFound};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명 (로깅용)
};
