#pragma once

// ---------------------------------------------------------------------------
// gate_settings.hpp
//
// 디버그 front-controller 접근 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 app/config/parameters.yml 의 parameters 섹션에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없거나 깨져 있으면
//   기본값 그대로 사용된다.
// - 생성 후 변경하지 않는다. AccessGate 가 const 로 보유한다.
// ---------------------------------------------------------------------------

#include <set>
#include <string>

// parameters.yml 키 이름
inline constexpr const char* kKeySecurityDisable        = "app_dev_security_disable";
inline constexpr const char* kKeyAllowHttpClientIp      = "app_dev_security_allow_http_client_ip";
inline constexpr const char* kKeyAllowHttpXForwardedFor = "app_dev_security_allow_http_x_forwarded_for";
inline constexpr const char* kKeyDisallowedSapiNames    = "app_dev_security_disallowed_php_sapi_names";
inline constexpr const char* kKeyAllowedRemoteAddr      = "app_dev_security_allowed_remote_addr";

// ---------------------------------------------------------------------------
// GateSettings
//   security_disabled = true 이면 나머지 필드는 판정에 쓰이지 않는다.
//   로더는 이 경우 나머지 키를 읽지도 않는다 (우회 설정과 강화 설정 공존 금지).
// ---------------------------------------------------------------------------
struct GateSettings {
    bool                  security_disabled{false};
    bool                  allow_http_client_ip{false};
    bool                  allow_http_x_forwarded_for{false};
    std::set<std::string> disallowed_sapi_names{"cli-server"};
    std::set<std::string> allowed_remote_addrs{"127.0.0.1", "fe80::1", "::1"};

    bool operator==(const GateSettings&) const = default;
};
