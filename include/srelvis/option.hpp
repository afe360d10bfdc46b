#ifndef SRELVIS_OPTION_HPP
#define SRELVIS_OPTION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace srelvis {

// Variable-creating types come first, in the fixed bucket order used by the generator.
enum class OptionType {
    Bool,
    Enum,
    List,
    Anything,
    Special,
    Flag,
    Alias,
};

enum class SpecialKind {
    Results,
    Language,
};

inline bool createsVariable(OptionType t) {
    return t == OptionType::Bool || t == OptionType::Enum || t == OptionType::List || t == OptionType::Anything ||
           t == OptionType::Special;
}

inline std::string_view optionTypeName(OptionType t) {
    switch (t) {
        case OptionType::Bool: return "bool";
        case OptionType::Enum: return "enum";
        case OptionType::List: return "list";
        case OptionType::Anything: return "anything";
        case OptionType::Special: return "special";
        case OptionType::Flag: return "flag";
        case OptionType::Alias: return "alias";
    }
    return "bool";
}

// "yes-no" is the historical spelling of "bool".
inline std::optional<OptionType> parseOptionType(std::string_view s) {
    if (s == "bool" || s == "yes-no") return OptionType::Bool;
    if (s == "enum") return OptionType::Enum;
    if (s == "list") return OptionType::List;
    if (s == "anything") return OptionType::Anything;
    if (s == "special") return OptionType::Special;
    if (s == "flag") return OptionType::Flag;
    if (s == "alias") return OptionType::Alias;
    return std::nullopt;
}

inline std::string_view specialKindName(SpecialKind k) {
    switch (k) {
        case SpecialKind::Results: return "results";
        case SpecialKind::Language: return "language";
    }
    return "results";
}

inline std::optional<SpecialKind> parseSpecialKind(std::string_view s) {
    if (s == "results") return SpecialKind::Results;
    if (s == "language") return SpecialKind::Language;
    return std::nullopt;
}

// An option that owns a `SURFRAW_<elvis>_<name>` variable in the generated script.
class VarOption {
public:
    static VarOption makeBool(std::string name, bool defaultValue) {
        VarOption o(OptionType::Bool, std::move(name));
        o.default_ = defaultValue ? "yes" : "no";
        return o;
    }

    static VarOption makeEnum(std::string name, std::string defaultValue, std::vector<std::string> values) {
        VarOption o(OptionType::Enum, std::move(name));
        o.default_ = std::move(defaultValue);
        o.values_ = std::move(values);
        return o;
    }

    static VarOption makeAnything(std::string name, std::string defaultValue) {
        VarOption o(OptionType::Anything, std::move(name));
        o.default_ = std::move(defaultValue);
        return o;
    }

    static VarOption makeList(std::string name,
                              OptionType elementType,
                              std::vector<std::string> defaults,
                              std::vector<std::string> values) {
        VarOption o(OptionType::List, std::move(name));
        o.elementType_ = elementType;
        o.defaults_ = std::move(defaults);
        o.values_ = std::move(values);
        return o;
    }

    static VarOption makeSpecial(SpecialKind kind);

    [[nodiscard]] OptionType type() const { return type_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& defaultValue() const { return default_; }
    [[nodiscard]] const std::vector<std::string>& defaults() const { return defaults_; }
    [[nodiscard]] const std::vector<std::string>& values() const { return values_; }
    [[nodiscard]] OptionType elementType() const { return elementType_; }
    [[nodiscard]] SpecialKind specialKind() const { return specialKind_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::vector<std::string>& flags() const { return flags_; }

    // Enums and enum lists are the only options whose values are checked at runtime.
    [[nodiscard]] bool isEnumLike() const {
        return type_ == OptionType::Enum || (type_ == OptionType::List && elementType_ == OptionType::Enum);
    }

    // Falls back to the upper-cased name.
    [[nodiscard]] std::string metavar() const;
    [[nodiscard]] std::string description() const;

    void setMetavar(std::string m) { metavar_ = std::move(m); }
    void setDescription(std::string d) { description_ = std::move(d); }
    void addAlias(std::string alias) { aliases_.push_back(std::move(alias)); }
    void addFlag(std::string flag) { flags_.push_back(std::move(flag)); }

private:
    VarOption(OptionType type, std::string name) : type_(type), name_(std::move(name)) {}

    OptionType type_;
    std::string name_;
    std::string default_;                // scalar default; for specials a shell expansion
    std::vector<std::string> defaults_;  // list defaults, duplicates and empty items kept
    std::vector<std::string> values_;    // valid values of enums and enum lists
    OptionType elementType_{OptionType::Anything};
    SpecialKind specialKind_{SpecialKind::Results};
    std::optional<std::string> metavar_;
    std::optional<std::string> description_;
    std::vector<std::string> aliases_;   // declaration order
    std::vector<std::string> flags_;     // declaration order
};

// Alias-with-value: `-NAME` behaves like `-TARGET=VALUE`.
class FlagOption {
public:
    FlagOption(std::string name, std::string target, OptionType targetType, std::string value)
        : name_(std::move(name)), target_(std::move(target)), targetType_(targetType), value_(std::move(value)) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& target() const { return target_; }
    [[nodiscard]] OptionType targetType() const { return targetType_; }
    [[nodiscard]] const std::string& value() const { return value_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }

    // For list targets the value is a comma-separated list; empty string means no items.
    [[nodiscard]] std::vector<std::string> listValues() const;

    void addAlias(std::string alias) { aliases_.push_back(std::move(alias)); }

private:
    std::string name_;
    std::string target_;
    OptionType targetType_;
    std::string value_;
    std::vector<std::string> aliases_;
};

// Alias-without-value. `targetType` picks the namespace: Flag looks in the flag registry,
// anything else in the variable registry.
class AliasOption {
public:
    AliasOption(std::string name, std::string target, OptionType targetType)
        : name_(std::move(name)), target_(std::move(target)), targetType_(targetType) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& target() const { return target_; }
    [[nodiscard]] OptionType targetType() const { return targetType_; }

private:
    std::string name_;
    std::string target_;
    OptionType targetType_;
};

struct CollapseBranch {
    std::vector<std::string> patterns;  // literal values, matched exactly
    std::string replacement;            // raw shell snippet; "$1" is the value being collapsed
};

struct Collapse {
    std::string variable;
    std::vector<CollapseBranch> branches;  // first match wins
};

struct Mapping {
    std::string variable;
    std::string parameter;
    bool urlEncode{true};
    bool list{false};  // one parameter per list element
};

struct Inline {
    std::string variable;
    std::string keyword;
    bool list{false};  // one keyword token per list element
};

} // namespace srelvis

#endif // SRELVIS_OPTION_HPP
