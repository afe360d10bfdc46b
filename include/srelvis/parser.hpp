#ifndef SRELVIS_PARSER_HPP
#define SRELVIS_PARSER_HPP

#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "flag.hpp"
#include "utils.hpp"

namespace srelvis {

// argv parser for mkelvis.
//
// Accepts --long VALUE, --long=VALUE, -s VALUE, -sVALUE, -s=VALUE and grouped short switches (-vq).
// Besides the per-flag values it keeps every occurrence in command-line order, which is how
// directives given through different flags keep their relative order.
class Parser {
public:
    struct Options {
        bool shortFlagGrouping{true}; // -vv
        bool suggestFlags{true};
        std::size_t suggestionsMinimumDistance{2};
    };

    struct Occurrence {
        std::string key; // canonical long name, e.g. "--enum"
        std::string value;
    };

    Parser(int argc, char** argv, const std::vector<Flag>& flags) : Parser(argc, argv, flags, Options{}) {}

    Parser(int argc, char** argv, const std::vector<Flag>& flags, Options options)
        : Parser(argsOf(argc, argv), flags, options) {}

    // `args` excludes the program name.
    Parser(const std::vector<std::string>& args, const std::vector<Flag>& flags)
        : Parser(args, flags, Options{}) {}

    Parser(const std::vector<std::string>& args, const std::vector<Flag>& flags, Options options)
        : options_(options) {
        aliases_["--help"] = "--help";
        aliases_["-h"] = "--help";
        kinds_["--help"] = Kind::Bool;

        aliases_["--version"] = "--version";
        kinds_["--version"] = Kind::Bool;

        for (const auto& f : flags) registerFlag(f);

        bool positionalOnly = false;
        for (std::size_t i = 0; i < args.size() && ok_; ++i) {
            const std::string& arg = args[i];
            if (!positionalOnly && arg == "--") {
                positionalOnly = true;
                continue;
            }

            if (positionalOnly || !isFlagToken(arg)) {
                positionals_.push_back(arg);
                continue;
            }

            // --k=v and -k=v
            const auto eq = arg.find('=');
            if (eq != std::string::npos) {
                const std::string key = arg.substr(0, eq);
                std::string value = arg.substr(eq + 1);
                const auto canonical = normalizeKey(key);
                const auto kindIt = kinds_.find(canonical);
                if (kindIt == kinds_.end()) {
                    failUnknownFlag(key);
                    continue;
                }
                if (kindIt->second == Kind::Count) {
                    fail("flag does not take a value: " + key);
                    continue;
                }
                if (!normalizeValue(canonical, value, kindIt->second)) continue;
                recordFlagValue(canonical, std::move(value));
                continue;
            }

            if (options_.shortFlagGrouping && isShortGroupToken(arg)) {
                parseShortGroup(arg, i, args);
                continue;
            }

            const auto canonical = normalizeKey(arg);
            const auto kindIt = kinds_.find(canonical);
            if (kindIt == kinds_.end()) {
                failUnknownFlag(arg);
                continue;
            }

            std::string value;
            switch (kindIt->second) {
                case Kind::Bool: value = "true"; break;
                case Kind::Count: value = "1"; break;
                default:
                    // The next token is the value even if it starts with '-': directive
                    // values such as `--anything sep:-` are legitimate.
                    if (i + 1 >= args.size()) {
                        fail("flag needs an argument: " + arg);
                        continue;
                    }
                    value = args[++i];
                    break;
            }
            if (!normalizeValue(canonical, value, kindIt->second)) continue;
            recordFlagValue(canonical, std::move(value));
        }
    }

    bool hasFlag(const std::string& flag) const {
        const auto it = flagValues_.find(resolveKey(flag));
        return it != flagValues_.end() && !it->second.empty();
    }

    template <typename T>
    T getFlag(const std::string& flag, T defaultValue = T()) const {
        const auto key = resolveKey(flag);
        const auto it = flagValues_.find(key);
        if (it != flagValues_.end() && !it->second.empty()) return parse<T>(it->second.back(), std::move(defaultValue));

        const auto defIt = defaults_.find(key);
        if (defIt != defaults_.end()) return parse<T>(defIt->second, std::move(defaultValue));

        return defaultValue;
    }

    int getCount(const std::string& flag) const {
        const auto it = flagValues_.find(resolveKey(flag));
        if (it == flagValues_.end()) return 0;
        int total = 0;
        for (const auto& v : it->second) total += parse<int>(v, 0);
        return total;
    }

    std::vector<std::string> getFlagValues(const std::string& flag) const {
        const auto it = flagValues_.find(resolveKey(flag));
        if (it == flagValues_.end()) return {};
        return it->second;
    }

    std::size_t occurrences(const std::string& flag) const {
        const auto it = flagValues_.find(resolveKey(flag));
        if (it == flagValues_.end()) return 0;
        return it->second.size();
    }

    // All flag values in the order they were given.
    const std::vector<Occurrence>& ordered() const { return ordered_; }

    const std::vector<std::string>& positionals() const { return positionals_; }

    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    enum class Kind { Bool, Count, Int, String };

    static std::vector<std::string> argsOf(int argc, char** argv) {
        std::vector<std::string> out;
        for (int i = 1; i < argc; ++i) out.emplace_back(argv[i]);
        return out;
    }

    static bool isFlagToken(const std::string& s) { return s.size() >= 2 && s[0] == '-' && s != "-"; }

    static bool isShortGroupToken(const std::string& s) {
        if (s.size() < 3) return false;
        if (s.rfind("--", 0) == 0) return false;
        return s[0] == '-' && s[1] != '-';
    }

    static std::string_view trimWs(std::string_view s) {
        std::size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
        std::size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(start, end - start);
    }

    std::string normalizeKey(const std::string& k) const {
        const auto it = aliases_.find(k);
        if (it != aliases_.end()) return it->second;
        return k;
    }

    std::string resolveKey(const std::string& k) const { return normalizeKey(k); }

    template <typename T>
    static T parse(const std::string& s, T defaultValue) {
        if constexpr (std::is_same_v<T, bool>) {
            bool out{};
            if (!tryParseBool(s, out)) return defaultValue;
            return out;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return s;
        } else {
            static_assert(std::is_integral_v<T>, "unsupported flag type");
            T out{};
            if (!tryParseSignedInt<T>(s, out)) return defaultValue;
            return out;
        }
    }

    static bool tryParseBool(std::string_view s, bool& out) {
        const auto t = trimWs(s);
        if (t == "1" || t == "true" || t == "yes" || t == "on") {
            out = true;
            return true;
        }
        if (t == "0" || t == "false" || t == "no" || t == "off") {
            out = false;
            return true;
        }
        return false;
    }

    template <typename T>
    static bool tryParseSignedInt(std::string_view s, T& out) {
        const auto t = trimWs(s);
        if (t.empty()) return false;
        const std::string tmp(t);
        char* end = nullptr;
        errno = 0;
        const long long v = std::strtoll(tmp.c_str(), &end, 10);
        if (errno != 0) return false;
        if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<T>::min()) ||
            v > static_cast<long long>(std::numeric_limits<T>::max())) {
            return false;
        }
        out = static_cast<T>(v);
        return true;
    }

    bool normalizeValue(const std::string& key, std::string& value, Kind kind) {
        bool valid = true;
        switch (kind) {
            case Kind::Bool: {
                bool parsed{};
                valid = tryParseBool(value, parsed);
                if (valid) value = parsed ? "true" : "false";
                break;
            }
            case Kind::Count:
            case Kind::Int: {
                int parsed{};
                valid = tryParseSignedInt<int>(value, parsed);
                break;
            }
            case Kind::String: break;
        }
        if (!valid) {
            fail("invalid argument \"" + value + "\" for \"" + key + "\"");
            return false;
        }
        return true;
    }

    static Kind kindOf(const Flag& f) {
        if (f.count()) return Kind::Count;
        if (std::holds_alternative<bool>(f.defaultValue())) return Kind::Bool;
        if (std::holds_alternative<int>(f.defaultValue())) return Kind::Int;
        return Kind::String;
    }

    static std::string toString(const FlagValue& v) {
        if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
        if (const auto* n = std::get_if<int>(&v)) return std::to_string(*n);
        return std::get<std::string>(v);
    }

    void registerFlag(const Flag& f) {
        if (f.longName().empty()) return;
        aliases_[f.longName()] = f.longName();
        kinds_[f.longName()] = kindOf(f);
        if (!f.count()) defaults_[f.longName()] = toString(f.defaultValue());
        knownKeys_.push_back(f.longName());
        if (!f.shortName().empty()) {
            aliases_[f.shortName()] = f.longName();
            knownKeys_.push_back(f.shortName());
        }
    }

    void recordFlagValue(const std::string& canonicalKey, std::string value) {
        flagValues_[canonicalKey].push_back(value);
        ordered_.push_back(Occurrence{canonicalKey, std::move(value)});
    }

    void parseShortGroup(const std::string& group, std::size_t& i, const std::vector<std::string>& args) {
        for (std::size_t pos = 1; pos < group.size(); ++pos) {
            const std::string key = std::string("-") + group[pos];
            const auto canonical = normalizeKey(key);
            const auto kindIt = kinds_.find(canonical);
            if (kindIt == kinds_.end()) {
                failUnknownFlag(key);
                return;
            }

            if (kindIt->second == Kind::Bool) {
                recordFlagValue(canonical, "true");
                continue;
            }
            if (kindIt->second == Kind::Count) {
                recordFlagValue(canonical, "1");
                continue;
            }

            // Needs a value: -ovalue OR -o value
            std::string value;
            if (pos + 1 < group.size()) {
                value = group.substr(pos + 1);
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                fail("flag needs an argument: " + key);
                return;
            }
            if (!normalizeValue(canonical, value, kindIt->second)) return;
            recordFlagValue(canonical, std::move(value));
            return;
        }
    }

    void fail(std::string message) {
        ok_ = false;
        error_ = std::move(message);
    }

    void failUnknownFlag(const std::string& key) {
        fail("unknown flag: " + key);
        if (!options_.suggestFlags || knownKeys_.empty()) return;
        const auto suggestions = utils::suggest(key, knownKeys_, /*maxResults=*/3, options_.suggestionsMinimumDistance);
        if (suggestions.empty()) return;
        error_ += "\n\nDid you mean this?\n";
        for (const auto& s : suggestions) error_ += "  " + s + "\n";
    }

    std::unordered_map<std::string, std::vector<std::string>> flagValues_;
    std::vector<Occurrence> ordered_;
    std::unordered_map<std::string, std::string> aliases_;
    std::unordered_map<std::string, Kind> kinds_;
    std::unordered_map<std::string, std::string> defaults_;
    std::vector<std::string> knownKeys_;
    std::vector<std::string> positionals_;
    bool ok_{true};
    std::string error_;
    Options options_;
};

} // namespace srelvis

#endif // SRELVIS_PARSER_HPP
