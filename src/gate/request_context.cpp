#include "gate/request_context.hpp"

#include <cstdlib>
#include <utility>

RequestContext make_request_context(const ServerVars& vars, std::string sapi_name) {
    RequestContext ctx{};
    ctx.has_client_ip_header     = vars.contains(kServerVarClientIp);
    ctx.has_forwarded_for_header = vars.contains(kServerVarForwardedFor);
    if (const auto it = vars.find(kServerVarRemoteAddr); it != vars.end()) {
        ctx.remote_addr = it->second;
    }
    ctx.sapi_name = std::move(sapi_name);
    return ctx;
}

RequestContext request_context_from_environment(std::string sapi_name) {
    ServerVars vars;
    for (const char* name : {kServerVarClientIp, kServerVarForwardedFor, kServerVarRemoteAddr}) {
        const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
        if (val != nullptr) {
            vars.emplace(name, val);
        }
    }
    return make_request_context(vars, std::move(sapi_name));
}
