#ifndef SRELVIS_FLAG_HPP
#define SRELVIS_FLAG_HPP

#include <string>
#include <utility>
#include <variant>

namespace srelvis {

using FlagValue = std::variant<bool, int, std::string>;

// A command-line flag of mkelvis. The type of the default selects how values are parsed.
class Flag {
public:
    explicit Flag(std::string longName,
                  std::string shortName,
                  std::string description,
                  std::string varName,
                  FlagValue defaultValue)
        : longName_(std::move(longName)),
          shortName_(std::move(shortName)),
          varName_(std::move(varName)),
          description_(std::move(description)),
          defaultValue_(std::move(defaultValue)) {}

    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] const std::string& shortName() const { return shortName_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::string& varName() const { return varName_; }
    [[nodiscard]] const FlagValue& defaultValue() const { return defaultValue_; }

    // Count flags take no value; every occurrence adds one (-vvv).
    [[nodiscard]] bool count() const { return count_; }
    [[nodiscard]] bool hidden() const { return hidden_; }

    Flag& setCount(bool v) {
        count_ = v;
        return *this;
    }
    Flag& setHidden(bool v) {
        hidden_ = v;
        return *this;
    }

private:
    std::string longName_;    // --output
    std::string shortName_;   // -o
    std::string varName_;     // FILE
    std::string description_; // where to write the elvis
    FlagValue defaultValue_;
    bool count_{false};
    bool hidden_{false};
};

} // namespace srelvis

#endif // SRELVIS_FLAG_HPP
