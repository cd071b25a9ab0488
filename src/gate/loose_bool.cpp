#include "gate/loose_bool.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::array<std::string_view, 4> kTruthyLiterals{"1", "true", "on", "yes"};

bool is_ascii_space(unsigned char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

}  // namespace

bool parse_loose_bool(std::string_view value) noexcept {
    while (!value.empty() && is_ascii_space(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_ascii_space(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }

    return std::any_of(kTruthyLiterals.begin(), kTruthyLiterals.end(),
                       [value](std::string_view literal) { return iequals(value, literal); });
}
