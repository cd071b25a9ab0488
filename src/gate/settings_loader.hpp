#pragma once

// ---------------------------------------------------------------------------
// settings_loader.hpp
//
// parameters.yml 을 찾아 읽고 파싱하여 GateSettings 를 만드는 로더.
//
// [설계 원칙]
// - load() 는 실패를 std::unexpected(ConfigError) 로 반환한다.
//   파일 없음 / 읽기 실패 / YAML 문법 오류를 구분하므로 테스트에서
//   오류 경로를 직접 검증할 수 있다.
// - 오류를 기본값으로 바꾸는 곳은 load_or_defaults() 한 곳뿐이다.
//   AccessGate 는 이 함수만 호출한다.
// - 키 단위로 독립 적용: 없는 키, null 키, 형태가 맞지 않는 키는
//   해당 필드만 기본값을 유지한다.
//
// [순환 의존성]
// settings_loader.hpp → gate_settings.hpp, common/types.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되 파일 내용 전체를 로그에 출력하지 말 것
//   (parameters.yml 에는 DB 비밀번호 등이 함께 들어 있다).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/types.hpp"     // ConfigError
#include "gate_settings.hpp"    // GateSettings

inline constexpr const char* kParametersFileName = "parameters.yml";
inline constexpr const char* kDefaultConfigDir   = "app/config";

class SettingsLoader {
public:
    // locate_file
    //   search_dirs 를 순서대로 검사하여 file_name 이 존재하는 첫 경로를 반환한다.
    //   file_name 이 절대 경로이면 search_dirs 를 무시하고 그 경로만 검사한다.
    //   실패: kNotFound
    [[nodiscard]] static std::expected<std::filesystem::path, ConfigError>
    locate_file(std::string_view                          file_name,
                const std::vector<std::filesystem::path>& search_dirs);

    // read_file
    //   파일 전체를 문자열로 읽는다. 실패: kUnreadable
    [[nodiscard]] static std::expected<std::string, ConfigError>
    read_file(const std::filesystem::path& path);

    // parse_yaml
    //   YAML 텍스트를 노드 트리로 파싱한다. 실패: kParseError (line/col 포함)
    //   빈 텍스트는 Null 노드로 성공 처리된다.
    [[nodiscard]] static std::expected<YAML::Node, ConfigError>
    parse_yaml(const std::string& text);

    // extract_settings
    //   파싱된 루트 노드에서 parameters 섹션을 읽는다. 실패하지 않는다.
    //   루트가 map 이 아니거나 parameters map 이 없으면 기본값.
    [[nodiscard]] static GateSettings extract_settings(const YAML::Node& root);

    // load
    //   locate_file → read_file → parse_yaml → extract_settings.
    [[nodiscard]] static std::expected<GateSettings, ConfigError>
    load(const std::vector<std::filesystem::path>& search_dirs);

    // load_or_defaults
    //   load() 실패 시 경고 로그를 남기고 GateSettings{} 를 반환한다.
    [[nodiscard]] static GateSettings
    load_or_defaults(const std::vector<std::filesystem::path>& search_dirs);
};
