// ---------------------------------------------------------------------------
// settings_loader.cpp
//
// parameters.yml 을 로드하여 GateSettings 구조체로 변환한다.
//
// [설계 원칙]
// - 파일 탐색 / 읽기 / 파싱을 각각 std::expected 로 분리한다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - app_dev_security_disable 이 참이면 나머지 키는 읽지 않는다.
//   우회 설정이 켜진 상태에서 일부 검사만 다시 켜는 구성은 허용하지 않는다.
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
//
// [알려진 한계]
// - 목록 키에 map 을 지정하면 key 는 무시하고 value 만 목록 항목으로 쓴다.
// - 목록 항목 비교는 문자열 완전 일치만 사용한다 (숫자형 문자열 정규화 없음).
// ---------------------------------------------------------------------------

#include "gate/settings_loader.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "gate/loose_bool.hpp"

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: isset 의미의 존재 검사. 키가 없거나 값이 null 이면 false.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_set(const YAML::Node& node) {
    return node && !node.IsNull();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 loose bool 을 읽는다. 없으면 fallback 반환.
// 스칼라가 아니면 형태 불일치로 보고 fallback 을 유지한다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool read_loose_bool(const YAML::Node& node, const char* key, bool fallback) {
    if (!is_set(node)) {
        return fallback;
    }
    if (!node.IsScalar()) {
        spdlog::warn("settings_loader: '{}' is not a scalar, keeping default {}", key, fallback);
        return fallback;
    }
    return parse_loose_bool(node.Scalar());
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 집합을 읽는다.
// sequence 는 항목을, map 은 value 를 모은다.
// 노드가 없거나 둘 다 아니면 fallback 을 그대로 반환한다.
// 비스칼라 항목은 건너뛴다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::set<std::string> read_string_set(const YAML::Node&            node,
                                                    const char*                  key,
                                                    const std::set<std::string>& fallback) {
    if (!is_set(node)) {
        return fallback;
    }
    if (!node.IsSequence() && !node.IsMap()) {
        spdlog::warn("settings_loader: '{}' is not a list, keeping default", key);
        return fallback;
    }

    std::set<std::string> result;
    const auto collect = [&](const YAML::Node& item) {
        if (item.IsScalar()) {
            result.insert(item.Scalar());
        } else {
            spdlog::debug("settings_loader: skipping non-scalar item in '{}'", key);
        }
    };

    if (node.IsMap()) {
        for (const auto& kv : node) {
            collect(kv.second);
        }
    } else {
        for (const auto& item : node) {
            collect(item);
        }
    }
    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// SettingsLoader::locate_file
// ---------------------------------------------------------------------------
std::expected<std::filesystem::path, ConfigError>
SettingsLoader::locate_file(std::string_view                          file_name,
                            const std::vector<std::filesystem::path>& search_dirs) {
    const std::filesystem::path name{file_name};
    std::error_code ec;

    if (name.is_absolute()) {
        if (std::filesystem::is_regular_file(name, ec)) {
            return name;
        }
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNotFound,
            fmt::format("settings_loader: file '{}' does not exist", name.string())});
    }

    for (const auto& dir : search_dirs) {
        const auto candidate = dir / name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }

    std::string dirs;
    for (const auto& dir : search_dirs) {
        if (!dirs.empty()) {
            dirs += ", ";
        }
        dirs += dir.string();
    }
    return std::unexpected(ConfigError{
        ConfigErrorCode::kNotFound,
        fmt::format("settings_loader: file '{}' does not exist in ({})", name.string(), dirs)});
}

// ---------------------------------------------------------------------------
// SettingsLoader::read_file
// ---------------------------------------------------------------------------
std::expected<std::string, ConfigError>
SettingsLoader::read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kUnreadable,
            fmt::format("settings_loader: cannot open file '{}'", path.string())});
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kUnreadable,
            fmt::format("settings_loader: read error on '{}'", path.string())});
    }
    return buf.str();
}

// ---------------------------------------------------------------------------
// SettingsLoader::parse_yaml
// ---------------------------------------------------------------------------
std::expected<YAML::Node, ConfigError>
SettingsLoader::parse_yaml(const std::string& text) {
    try {
        return YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        return std::unexpected(ConfigError{
            ConfigErrorCode::kParseError,
            fmt::format("settings_loader: YAML parse error at line {}, col {}: {}",
                        e.mark.line + 1,   // yaml-cpp는 0-based
                        e.mark.column + 1,
                        e.msg)});
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kParseError,
            fmt::format("settings_loader: YAML error: {}", e.what())});
    }
}

// ---------------------------------------------------------------------------
// SettingsLoader::extract_settings
// ---------------------------------------------------------------------------
GateSettings SettingsLoader::extract_settings(const YAML::Node& root) {
    GateSettings settings{};

    if (!root || !root.IsMap()) {
        spdlog::debug("settings_loader: top-level is not a map, using defaults");
        return settings;
    }

    const YAML::Node params = root["parameters"];
    if (!params || !params.IsMap()) {
        spdlog::debug("settings_loader: no 'parameters' map, using defaults");
        return settings;
    }

    settings.security_disabled =
        read_loose_bool(params[kKeySecurityDisable], kKeySecurityDisable, settings.security_disabled);
    if (settings.security_disabled) {
        spdlog::warn("settings_loader: debug front controller security is DISABLED");
        return settings;
    }

    settings.allow_http_client_ip = read_loose_bool(
        params[kKeyAllowHttpClientIp], kKeyAllowHttpClientIp, settings.allow_http_client_ip);
    settings.allow_http_x_forwarded_for = read_loose_bool(
        params[kKeyAllowHttpXForwardedFor], kKeyAllowHttpXForwardedFor,
        settings.allow_http_x_forwarded_for);
    settings.disallowed_sapi_names = read_string_set(
        params[kKeyDisallowedSapiNames], kKeyDisallowedSapiNames, settings.disallowed_sapi_names);
    settings.allowed_remote_addrs = read_string_set(
        params[kKeyAllowedRemoteAddr], kKeyAllowedRemoteAddr, settings.allowed_remote_addrs);

    return settings;
}

// ---------------------------------------------------------------------------
// SettingsLoader::load
// ---------------------------------------------------------------------------
std::expected<GateSettings, ConfigError>
SettingsLoader::load(const std::vector<std::filesystem::path>& search_dirs) {
    const auto path = locate_file(kParametersFileName, search_dirs);
    if (!path) {
        return std::unexpected(path.error());
    }

    spdlog::info("settings_loader: loading parameters from '{}'", path->string());

    const auto text = read_file(*path);
    if (!text) {
        return std::unexpected(text.error());
    }

    const auto root = parse_yaml(*text);
    if (!root) {
        return std::unexpected(root.error());
    }

    GateSettings settings = extract_settings(*root);

    spdlog::info(
        "settings_loader: parameters loaded: security_disabled={}, allow_http_client_ip={}, "
        "allow_http_x_forwarded_for={}, disallowed_sapi_names={}, allowed_remote_addrs={}",
        settings.security_disabled,
        settings.allow_http_client_ip,
        settings.allow_http_x_forwarded_for,
        settings.disallowed_sapi_names.size(),
        settings.allowed_remote_addrs.size()
    );

    return settings;
}

// ---------------------------------------------------------------------------
// SettingsLoader::load_or_defaults
//   오류 → 기본값 변환은 이 함수에서만 수행한다.
// ---------------------------------------------------------------------------
GateSettings
SettingsLoader::load_or_defaults(const std::vector<std::filesystem::path>& search_dirs) {
    auto result = load(search_dirs);
    if (!result) {
        spdlog::warn("{}: using default settings", result.error().message);
        return GateSettings{};
    }
    return std::move(*result);
}
