#include "srelvis/escape.hpp"

namespace srelvis::escape {

static bool isUnreserved(unsigned char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' ||
           ch == '.' || ch == '_' || ch == '~';
}

std::string percentEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        const auto ch = static_cast<unsigned char>(c);
        if (isUnreserved(ch)) {
            out.push_back(c);
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[ch >> 4]);
        out.push_back(kHex[ch & 0x0F]);
    }
    return out;
}

bool containsWhitespace(std::string_view s) {
    for (const char ch : s) {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f') return true;
    }
    return false;
}

std::optional<std::string> inlineToken(std::string_view keyword, std::string_view value) {
    if (value.empty()) return std::nullopt;
    std::string out(keyword);
    out += ':';
    if (containsWhitespace(value)) {
        out += '"';
        out += value;
        out += '"';
    } else {
        out += value;
    }
    return out;
}

std::vector<std::string> removalPatterns(const std::vector<std::string>& items) {
    std::vector<std::string> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

std::string shellSingleQuote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (const char ch : s) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

std::string escapeDoubleQuotes(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t run = 0;
        while (i + run < s.size() && s[i + run] == '\\') ++run;
        i += run;
        // A run of backslashes before a quote or the closing quote would eat it.
        const bool guarded = i == s.size() || s[i] == '"';
        out.append(guarded ? run * 2 : run, '\\');
        if (i == s.size()) break;
        if (s[i] == '"') out.push_back('\\');
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

std::string escapeHeredoc(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        if (ch == '\\' || ch == '$' || ch == '`') out.push_back('\\');
        out.push_back(ch);
    }
    return out;
}

std::string casePattern(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += '|';
        out += shellSingleQuote(items[i]);
    }
    return out;
}

} // namespace srelvis::escape
