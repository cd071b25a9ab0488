#pragma once

#include <string_view>

// ---------------------------------------------------------------------------
// parse_loose_bool
//   설정 스칼라를 bool 로 해석한다. 항상 값을 반환한다 (total).
//
//   앞뒤 ASCII 공백 제거 후 대소문자 무관하게
//     "1", "true", "on", "yes"  → true
//   그 외 모든 값 (빈 문자열, "0", "false", "off", "no", 임의 문자열) → false
// ---------------------------------------------------------------------------
[[nodiscard]] bool parse_loose_bool(std::string_view value) noexcept;
