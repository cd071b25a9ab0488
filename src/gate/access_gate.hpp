#pragma once

// ---------------------------------------------------------------------------
// access_gate.hpp
//
// 디버그 front-controller 를 현재 요청에 제공해도 되는지 판정한다.
//
// [판정 순서: 순서 자체가 우선순위다]
// 1. security_disabled              → kAllow (전체 우회, 최우선)
// 2. HTTP_CLIENT_IP 존재 + 불허       → kDeny
// 3. HTTP_X_FORWARDED_FOR 존재 + 불허 → kDeny
// 4. REMOTE_ADDR 가 허용 목록에 없음   → kDeny (주소 없음도 포함)
// 5. SAPI 이름이 금지 목록에 있음      → kDeny
// 6. 그 외                           → kAllow
//
// 프록시 헤더 검사는 주소 허용 목록 검사보다 먼저 수행된다.
// 위조 가능한 신호가 있으면 REMOTE_ADDR 를 신뢰하기 전에 거부한다.
//
// [순환 의존성: 무순환 구조]
// access_gate.hpp → gate_settings.hpp, settings_loader.hpp, common/types.hpp
// ---------------------------------------------------------------------------

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"       // RequestContext
#include "gate_settings.hpp"      // GateSettings
#include "settings_loader.hpp"    // kDefaultConfigDir

// ---------------------------------------------------------------------------
// GateAction
// ---------------------------------------------------------------------------
enum class GateAction : std::uint8_t {
    kAllow = 0,
    kDeny  = 1,
};

// ---------------------------------------------------------------------------
// GateVerdict
//   판정 결과.
//   matched_rule: 판정을 결정한 guard 식별자 (로그용).
//   reason: 사람이 읽을 수 있는 판정 이유. 클라이언트에 그대로 노출하지 말 것.
// ---------------------------------------------------------------------------
struct GateVerdict {
    GateAction  action{GateAction::kDeny};
    std::string matched_rule{};
    std::string reason{};
};

// evaluate_access
//   settings 와 request 만으로 판정하는 순수 함수. 예외를 던지지 않는다.
[[nodiscard]] GateVerdict evaluate_access(const GateSettings&   settings,
                                          const RequestContext& request);

// is_accessible
//   evaluate_access(...).action == kAllow
[[nodiscard]] bool is_accessible(const GateSettings&   settings,
                                 const RequestContext& request) noexcept;

// ---------------------------------------------------------------------------
// AccessGate
//   생성 시 설정을 한 번 로드하고 이후 읽기 전용으로 보유한다.
//
//   [스레드 안전성]
//   생성 이후 모든 멤버 함수는 const 이며 concurrent 호출 안전.
// ---------------------------------------------------------------------------
class AccessGate {
public:
    // 기본 설정 디렉터리(app/config)에서 parameters.yml 을 로드한다.
    AccessGate();

    // config_dir 에서 parameters.yml 을 로드한다.
    explicit AccessGate(const std::filesystem::path& config_dir);

    // search_dirs 를 순서대로 탐색하여 parameters.yml 을 로드한다.
    explicit AccessGate(const std::vector<std::filesystem::path>& search_dirs);

    // 이미 만들어진 설정을 주입한다 (파일 I/O 없음).
    explicit AccessGate(GateSettings settings);

    [[nodiscard]] bool        is_accessible(const RequestContext& request) const noexcept;
    [[nodiscard]] GateVerdict evaluate(const RequestContext& request) const;

    [[nodiscard]] const GateSettings& settings() const noexcept { return settings_; }

    [[nodiscard]] static std::string_view forbidden_message() noexcept;
    [[nodiscard]] static std::string_view forbidden_status_line() noexcept;

    // 거부 시 클라이언트에 쓰는 전체 응답: 상태 줄 + 빈 줄 + 메시지 + 개행
    [[nodiscard]] static std::string forbidden_response();

private:
    const GateSettings settings_;
};
