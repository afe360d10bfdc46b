#include "srelvis/error.hpp"

namespace srelvis {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedDirective: return "malformed directive";
        case ErrorKind::DuplicateName: return "duplicate name";
        case ErrorKind::UnresolvedReference: return "unresolved reference";
        case ErrorKind::InvalidAliasChain: return "invalid alias chain";
        case ErrorKind::InvalidDefault: return "invalid default";
        case ErrorKind::MissingQueryParameter: return "missing query parameter";
        case ErrorKind::SchemeMismatch: return "scheme mismatch";
        case ErrorKind::InvalidFlagValue: return "invalid flag value";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::InvalidSetting: return "invalid setting";
    }
    return "error";
}

std::string CompileError::describe() const {
    if (!directiveIndex_.has_value()) return message_;
    // Directive indices are reported 1-based, the way a user counts them on the command line.
    std::string out = "directive #" + std::to_string(*directiveIndex_ + 1);
    if (!directiveType_.empty()) out += " (--" + directiveType_ + ")";
    out += ": ";
    out += message_;
    return out;
}

} // namespace srelvis
