// ---------------------------------------------------------------------------
// test_request_context.cpp
//
// 서버 변수 / 프로세스 환경 → RequestContext 어댑터 테스트.
// ---------------------------------------------------------------------------

#include "gate/access_gate.hpp"
#include "gate/request_context.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

TEST(RequestContext, FromServerVars_PlainRequest) {
    const ServerVars vars{{"REMOTE_ADDR", "127.0.0.1"}, {"REQUEST_URI", "/app_dev.php"}};
    const auto ctx = make_request_context(vars, "fpm-fcgi");

    EXPECT_FALSE(ctx.has_client_ip_header);
    EXPECT_FALSE(ctx.has_forwarded_for_header);
    ASSERT_TRUE(ctx.remote_addr.has_value());
    EXPECT_EQ(*ctx.remote_addr, "127.0.0.1");
    EXPECT_EQ(ctx.sapi_name, "fpm-fcgi");
}

TEST(RequestContext, FromServerVars_ProxyHeadersPresent) {
    const ServerVars vars{
        {"REMOTE_ADDR", "127.0.0.1"},
        {"HTTP_CLIENT_IP", "198.51.100.7"},
        {"HTTP_X_FORWARDED_FOR", "198.51.100.7, 10.0.0.1"},
    };
    const auto ctx = make_request_context(vars, "fpm-fcgi");
    EXPECT_TRUE(ctx.has_client_ip_header);
    EXPECT_TRUE(ctx.has_forwarded_for_header);
}

TEST(RequestContext, FromServerVars_EmptyHeaderValue_CountsAsPresent) {
    const ServerVars vars{{"REMOTE_ADDR", "127.0.0.1"}, {"HTTP_X_FORWARDED_FOR", ""}};
    const auto ctx = make_request_context(vars, "fpm-fcgi");
    EXPECT_TRUE(ctx.has_forwarded_for_header);
    EXPECT_FALSE(is_accessible(GateSettings{}, ctx));
}

TEST(RequestContext, FromServerVars_NoRemoteAddr_Denied) {
    const auto ctx = make_request_context(ServerVars{}, "fpm-fcgi");
    EXPECT_FALSE(ctx.remote_addr.has_value());
    EXPECT_FALSE(is_accessible(GateSettings{}, ctx));
}

TEST(RequestContext, FromEnvironment_ReadsCgiVariables) {
    ::setenv("REMOTE_ADDR", "::1", 1);
    ::setenv("HTTP_CLIENT_IP", "198.51.100.7", 1);
    ::unsetenv("HTTP_X_FORWARDED_FOR");

    const auto ctx = request_context_from_environment("cgi-fcgi");
    ASSERT_TRUE(ctx.remote_addr.has_value());
    EXPECT_EQ(*ctx.remote_addr, "::1");
    EXPECT_TRUE(ctx.has_client_ip_header);
    EXPECT_FALSE(ctx.has_forwarded_for_header);
    EXPECT_EQ(ctx.sapi_name, "cgi-fcgi");

    ::unsetenv("REMOTE_ADDR");
    ::unsetenv("HTTP_CLIENT_IP");
}

TEST(RequestContext, FromEnvironment_NothingSet) {
    ::unsetenv("REMOTE_ADDR");
    ::unsetenv("HTTP_CLIENT_IP");
    ::unsetenv("HTTP_X_FORWARDED_FOR");

    const auto ctx = request_context_from_environment("cli-server");
    EXPECT_FALSE(ctx.remote_addr.has_value());
    EXPECT_FALSE(ctx.has_client_ip_header);
    EXPECT_FALSE(ctx.has_forwarded_for_header);
}
