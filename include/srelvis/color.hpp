#ifndef SRELVIS_COLOR_HPP
#define SRELVIS_COLOR_HPP

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace srelvis {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

enum class ColorRole {
    Program,
    Error,
    Warning,
    Note,
};

namespace color {

enum class Stream {
    Stdout,
    Stderr,
    Other,
};

// Returns true if the underlying stream is a terminal.
bool isTty(Stream stream);

inline bool envNoColor() {
    // https://no-color.org/
    return std::getenv("NO_COLOR") != nullptr;
}

inline bool envTermDumb() {
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) == "dumb";
}

// Always wins over the environment; Auto needs a terminal, no NO_COLOR and a non-dumb TERM.
inline bool enabled(ColorMode mode, Stream stream) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never: return false;
        case ColorMode::Auto: return !envNoColor() && !envTermDumb() && isTty(stream);
    }
    return false;
}

inline std::string_view code(ColorRole role) {
    switch (role) {
        case ColorRole::Program: return "\x1b[1m";         // bold
        case ColorRole::Error: return "\x1b[1m\x1b[31m";   // bold red
        case ColorRole::Warning: return "\x1b[1m\x1b[33m"; // bold yellow
        case ColorRole::Note: return "\x1b[2m";            // dim
    }
    return "";
}

inline constexpr std::string_view kReset = "\x1b[0m";

inline std::string paint(bool on, ColorRole role, std::string_view text) {
    if (!on || text.empty()) return std::string(text);
    std::string out(code(role));
    out += text;
    out += kReset;
    return out;
}

inline std::optional<ColorMode> parseMode(std::string_view s) {
    if (s == "auto") return ColorMode::Auto;
    if (s == "always") return ColorMode::Always;
    if (s == "never") return ColorMode::Never;
    return std::nullopt;
}

} // namespace color
} // namespace srelvis

#endif // SRELVIS_COLOR_HPP
