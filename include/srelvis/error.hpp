#ifndef SRELVIS_ERROR_HPP
#define SRELVIS_ERROR_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace srelvis {

enum class ErrorKind {
    MalformedDirective,
    DuplicateName,
    UnresolvedReference,
    InvalidAliasChain,
    InvalidDefault,
    MissingQueryParameter,
    SchemeMismatch,
    InvalidFlagValue,
    TypeMismatch,
    InvalidSetting,
};

std::string_view errorKindName(ErrorKind kind);

// Thrown by every compiler stage. The first error aborts the whole compile; nothing is rendered.
class CompileError : public std::runtime_error {
public:
    CompileError(ErrorKind kind, std::string message)
        : std::runtime_error(message), kind_(kind), message_(std::move(message)) {}

    CompileError(ErrorKind kind, std::string message, std::size_t directiveIndex, std::string directiveType)
        : std::runtime_error(message),
          kind_(kind),
          message_(std::move(message)),
          directiveIndex_(directiveIndex),
          directiveType_(std::move(directiveType)) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::optional<std::size_t>& directiveIndex() const { return directiveIndex_; }
    [[nodiscard]] const std::string& directiveType() const { return directiveType_; }

    // "directive #3 (--enum): ..." when the error stems from a directive, the bare message otherwise.
    [[nodiscard]] std::string describe() const;

private:
    ErrorKind kind_;
    std::string message_;
    std::optional<std::size_t> directiveIndex_;
    std::string directiveType_;
};

} // namespace srelvis

#endif // SRELVIS_ERROR_HPP
