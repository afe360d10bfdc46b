#include "srelvis/validation.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

namespace {

bool isLower(char ch) { return ch >= 'a' && ch <= 'z'; }
bool isDigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr std::string_view kReservedNames[] = {
    "browser", "elvi", "g", "graphical", "h", "help", "lh", "p", "print", "o", "new",
    "ns", "newscreen", "t", "text", "q", "quote", "version",
    // Hyphenated globals, in case hyphens ever become valid in names.
    "bookmark-search-elvis", "custom-search", "escape-url-args", "local-help",
};

} // namespace

namespace srelvis {

bool isValidName(std::string_view name) {
    if (name.empty()) return false;
    for (const char ch : name) {
        if (!isLower(ch)) return false;
    }
    return true;
}

bool isReservedName(std::string_view name) {
    for (const auto reserved : kReservedNames) {
        if (reserved == name) return true;
    }
    return false;
}

bool isValidEnumValue(std::string_view value) {
    if (value.empty()) return false;
    if (!isLower(value[0]) && !isDigit(value[0])) return false;
    for (std::size_t i = 1; i < value.size(); ++i) {
        const char ch = value[i];
        if (isLower(ch) || isDigit(ch) || ch == '_' || ch == '+' || ch == '-') continue;
        return false;
    }
    return true;
}

bool isValidMetavar(std::string_view metavar) { return isValidName(metavar); }

bool tryParseYesNo(std::string_view s, bool& out) {
    if (s == "yes") {
        out = true;
        return true;
    }
    if (s == "no") {
        out = false;
        return true;
    }
    return false;
}

bool tryParseInt(std::string_view s, long long& out) {
    if (s.empty()) return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

bool isValidElvisName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos;
}

} // namespace srelvis
