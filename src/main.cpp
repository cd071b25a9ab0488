// ---------------------------------------------------------------------------
// main.cpp
//
// devgate: 디버그 front-controller 앞단의 CGI 스타일 접근 가드.
//
// 현재 프로세스 환경(REMOTE_ADDR, HTTP_CLIENT_IP, HTTP_X_FORWARDED_FOR)을
// 판정하여
//   허용 → 아무것도 출력하지 않고 종료 코드 0
//   거부 → stdout 에 403 상태 줄 + 빈 줄 + 거부 메시지, 종료 코드 1
// 진단 로그는 stderr 로만 출력한다.
// ---------------------------------------------------------------------------

#include "gate/access_gate.hpp"
#include "gate/request_context.hpp"
#include "logger/structured_logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

// 거부 응답: 403 상태 줄 + 빈 줄 + 거부 메시지
void print_forbidden() {
    const std::string response = AccessGate::forbidden_response();
    std::fwrite(response.data(), 1, response.size(), stdout);
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const std::string config_dir = env_str("DEVGATE_CONFIG_DIR", kDefaultConfigDir);
    const std::string sapi_name  = env_str("DEVGATE_SAPI_NAME",  "cgi-fcgi");
    const std::string log_level  = env_str("LOG_LEVEL",          "warn");

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    auto level = parse_log_level(log_level);
    if (!level) {
        std::fprintf(stderr, "devgate: unknown LOG_LEVEL '%s', using warn\n", log_level.c_str());
        level = LogLevel::kWarn;
    }

    try {
        StructuredLogger logger{*level};
        logger.install_as_default();

        spdlog::info("Starting devgate");
        spdlog::info("Config dir: {}", config_dir);
        spdlog::info("SAPI: {}", sapi_name);

        // ── 판정 ────────────────────────────────────────────────────────
        const AccessGate     gate{std::filesystem::path{config_dir}};
        const RequestContext request = request_context_from_environment(sapi_name);
        const GateVerdict    verdict = gate.evaluate(request);
        const bool           allowed = verdict.action == GateAction::kAllow;

        logger.log_decision(DecisionLog{
            allowed,
            verdict.matched_rule,
            verdict.reason,
            request.remote_addr.value_or(""),
            request.sapi_name,
            std::chrono::system_clock::now(),
        });

        if (!allowed) {
            print_forbidden();
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        // 로거 초기화 실패 등: 판정 불가이므로 거부
        std::fprintf(stderr, "devgate: %s\n", e.what());
        print_forbidden();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
