#ifndef SRELVIS_DIAG_HPP
#define SRELVIS_DIAG_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "color.hpp"

namespace srelvis {

enum class Level {
    Error,
    Warning,
    Info,
    Debug,
};

// "-q" -> Error, default -> Warning, "-v" -> Info, "-vv" and up -> Debug.
inline Level levelFromVerbosity(int verbose, bool quiet) {
    if (quiet) return Level::Error;
    if (verbose <= 0) return Level::Warning;
    if (verbose == 1) return Level::Info;
    return Level::Debug;
}

// Writes `PROGRAM: [level: ]message` lines to one stream, dropping anything below the threshold.
class Diagnostics {
public:
    Diagnostics(std::ostream& os, std::string program, Level threshold, bool color)
        : os_(&os), program_(std::move(program)), threshold_(threshold), color_(color) {}

    [[nodiscard]] Level threshold() const { return threshold_; }
    [[nodiscard]] bool color() const { return color_; }
    void setThreshold(Level level) { threshold_ = level; }
    void setColor(bool on) { color_ = on; }

    [[nodiscard]] bool enabled(Level level) const { return static_cast<int>(level) <= static_cast<int>(threshold_); }

    void error(std::string_view msg) const { log(Level::Error, msg); }
    void warning(std::string_view msg) const { log(Level::Warning, msg); }
    void info(std::string_view msg) const { log(Level::Info, msg); }
    void debug(std::string_view msg) const { log(Level::Debug, msg); }

    void log(Level level, std::string_view msg) const {
        if (!enabled(level)) return;
        auto& os = *os_;
        os << color::paint(color_, ColorRole::Program, program_ + ":") << " ";
        switch (level) {
            case Level::Error: os << color::paint(color_, ColorRole::Error, msg); break;
            case Level::Warning: os << color::paint(color_, ColorRole::Warning, "warning:") << " " << msg; break;
            case Level::Info: os << msg; break;
            case Level::Debug: os << color::paint(color_, ColorRole::Note, "debug:") << " " << msg; break;
        }
        os << "\n";
    }

private:
    std::ostream* os_;
    std::string program_;
    Level threshold_;
    bool color_;
};

} // namespace srelvis

#endif // SRELVIS_DIAG_HPP
