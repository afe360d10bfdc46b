#ifndef SRELVIS_VALIDATION_HPP
#define SRELVIS_VALIDATION_HPP

#include <string>
#include <string_view>

namespace srelvis {

// Variable names are deliberately narrower than shell names so that the generated
// `SURFRAW_<elvis>_<name>` variables stay readable: one lower-case word.
bool isValidName(std::string_view name);

// Names of surfraw's global options; an elvis cannot redefine them.
bool isReservedName(std::string_view name);

// Enum values must match ^[a-z0-9][a-z0-9_+-]*$.
bool isValidEnumValue(std::string_view value);
inline constexpr std::string_view kEnumValuePattern = "^[a-z0-9][a-z0-9_+-]*$";

// Metavars must match ^[a-z]+$ (they are upper-cased afterwards).
bool isValidMetavar(std::string_view metavar);

// surfraw booleans are the words "yes" and "no" only.
bool tryParseYesNo(std::string_view s, bool& out);
inline bool isYesNo(std::string_view s) {
    bool ignored = false;
    return tryParseYesNo(s, ignored);
}

bool tryParseInt(std::string_view s, long long& out);

// Elvis names become file names and `SURFRAW_<name>_` prefixes.
bool isValidElvisName(std::string_view name);

} // namespace srelvis

#endif // SRELVIS_VALIDATION_HPP
