#pragma once

// ---------------------------------------------------------------------------
// request_context.hpp
//
// CGI 스타일 서버 변수에서 RequestContext 를 만드는 경계 어댑터.
// 판정 로직은 환경을 직접 읽지 않으며, 환경 접근은 이 파일에만 존재한다.
// ---------------------------------------------------------------------------

#include <string>
#include <unordered_map>

#include "common/types.hpp"  // RequestContext

inline constexpr const char* kServerVarClientIp      = "HTTP_CLIENT_IP";
inline constexpr const char* kServerVarForwardedFor  = "HTTP_X_FORWARDED_FOR";
inline constexpr const char* kServerVarRemoteAddr    = "REMOTE_ADDR";

// 서버 변수 이름 → 값
using ServerVars = std::unordered_map<std::string, std::string>;

// make_request_context
//   헤더 존재 여부는 키 존재로만 판단한다 (빈 값도 존재로 본다).
//   REMOTE_ADDR 키가 없으면 remote_addr = std::nullopt.
[[nodiscard]] RequestContext make_request_context(const ServerVars& vars, std::string sapi_name);

// request_context_from_environment
//   현재 프로세스 환경변수(CGI)를 읽어 RequestContext 를 만든다.
[[nodiscard]] RequestContext request_context_from_environment(std::string sapi_name);
