// ---------------------------------------------------------------------------
// access_gate.cpp
//
// [판정 원칙]
// - 판정 함수는 항상 결과를 반환한다. 설정 로드 오류는 이미
//   SettingsLoader::load_or_defaults 에서 기본값으로 흡수되었다.
// - REMOTE_ADDR 가 없으면 허용 목록에 없는 것으로 본다 (deny).
//
// [알려진 한계]
// - 주소 비교는 문자열 완전 일치다. "::1" 과 "0:0:0:0:0:0:0:1" 은 다른 주소로
//   취급되며 CIDR 대역도 지원하지 않는다.
// ---------------------------------------------------------------------------

#include "gate/access_gate.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kForbiddenMessage    = "You are not allowed to access this file.";
constexpr std::string_view kForbiddenStatusLine = "HTTP/1.0 403 Forbidden";

GateVerdict allow(std::string rule, std::string reason) {
    return GateVerdict{GateAction::kAllow, std::move(rule), std::move(reason)};
}

GateVerdict deny(std::string rule, std::string reason) {
    return GateVerdict{GateAction::kDeny, std::move(rule), std::move(reason)};
}

}  // namespace

GateVerdict evaluate_access(const GateSettings& settings, const RequestContext& request) {
    // 1. 전체 우회
    if (settings.security_disabled) {
        return allow("security-disabled", "app_dev security disabled by configuration");
    }

    // 2~3. 프록시 헤더 (주소 검사보다 먼저)
    if (request.has_client_ip_header && !settings.allow_http_client_ip) {
        return deny("http-client-ip", "HTTP_CLIENT_IP header present");
    }
    if (request.has_forwarded_for_header && !settings.allow_http_x_forwarded_for) {
        return deny("http-x-forwarded-for", "HTTP_X_FORWARDED_FOR header present");
    }

    // 4. 주소 허용 목록
    if (!request.remote_addr) {
        return deny("remote-addr", "REMOTE_ADDR not set");
    }
    if (!settings.allowed_remote_addrs.contains(*request.remote_addr)) {
        return deny("remote-addr",
                    fmt::format("remote address '{}' not in allowlist", *request.remote_addr));
    }

    // 5. 실행 모드
    if (settings.disallowed_sapi_names.contains(request.sapi_name)) {
        return deny("sapi-name", fmt::format("sapi '{}' is disallowed", request.sapi_name));
    }

    return allow("default-allow", "all checks passed");
}

bool is_accessible(const GateSettings& settings, const RequestContext& request) noexcept {
    try {
        return evaluate_access(settings, request).action == GateAction::kAllow;
    } catch (const std::exception& e) {
        // 문자열 할당 실패 등: 판정 불가이므로 거부
        spdlog::error("access_gate: evaluation failed, denying: {}", e.what());
        return false;
    }
}

// ---------------------------------------------------------------------------
// AccessGate
// ---------------------------------------------------------------------------
AccessGate::AccessGate()
    : AccessGate(std::filesystem::path{kDefaultConfigDir}) {}

AccessGate::AccessGate(const std::filesystem::path& config_dir)
    : AccessGate(std::vector<std::filesystem::path>{config_dir}) {}

AccessGate::AccessGate(const std::vector<std::filesystem::path>& search_dirs)
    : settings_(SettingsLoader::load_or_defaults(search_dirs)) {}

AccessGate::AccessGate(GateSettings settings)
    : settings_(std::move(settings)) {}

bool AccessGate::is_accessible(const RequestContext& request) const noexcept {
    return ::is_accessible(settings_, request);
}

GateVerdict AccessGate::evaluate(const RequestContext& request) const {
    auto verdict = evaluate_access(settings_, request);
    if (verdict.action == GateAction::kDeny) {
        spdlog::debug("access_gate: denied by '{}': {}", verdict.matched_rule, verdict.reason);
    }
    return verdict;
}

std::string_view AccessGate::forbidden_message() noexcept {
    return kForbiddenMessage;
}

std::string_view AccessGate::forbidden_status_line() noexcept {
    return kForbiddenStatusLine;
}

std::string AccessGate::forbidden_response() {
    std::string response{kForbiddenStatusLine};
    response += "\r\n\r\n";
    response += kForbiddenMessage;
    response += '\n';
    return response;
}
