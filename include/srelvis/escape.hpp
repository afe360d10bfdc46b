#ifndef SRELVIS_ESCAPE_HPP
#define SRELVIS_ESCAPE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace srelvis::escape {

// RFC 3986 percent-encoding: everything outside A-Z a-z 0-9 - . _ ~ becomes %XX (upper-case hex).
std::string percentEncode(std::string_view s);

bool containsWhitespace(std::string_view s);

// `KEYWORD:VALUE`, with VALUE double-quoted iff it contains whitespace; nullopt for an empty value.
std::optional<std::string> inlineToken(std::string_view keyword, std::string_view value);

// Items of a removal list that can actually be used as patterns: empty items are dropped.
std::vector<std::string> removalPatterns(const std::vector<std::string>& items);

// 'it'\''s' style single quoting; the result is always a single shell word.
std::string shellSingleQuote(std::string_view s);

// Escapes `"`, and doubles a run of backslashes that ends at a quote or at the end of the
// text. Text placed inside double quotes keeps its $ and ` expansions.
std::string escapeDoubleQuotes(std::string_view s);

// Escapes \ $ and ` so that text reads literally inside an unquoted heredoc.
std::string escapeHeredoc(std::string_view s);

// 'a'|'b'|'c' : a case label matching each item literally.
std::string casePattern(const std::vector<std::string>& items);

} // namespace srelvis::escape

#endif // SRELVIS_ESCAPE_HPP
