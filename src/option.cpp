#include "srelvis/option.hpp"

#include "srelvis/utils.hpp"

namespace srelvis {

VarOption VarOption::makeSpecial(SpecialKind kind) {
    VarOption o(OptionType::Special, std::string(specialKindName(kind)));
    o.specialKind_ = kind;
    switch (kind) {
        case SpecialKind::Results:
            o.default_ = "$SURFRAW_results";
            o.metavar_ = "NUM";
            o.description_ = "Number of search results returned";
            break;
        case SpecialKind::Language:
            // An empty or unset SURFRAW_lang means English.
            o.default_ = "${SURFRAW_lang:=en}";
            o.metavar_ = "ISOCODE";
            o.description_ = "Two letter language code (resembles ISO country codes)";
            break;
    }
    return o;
}

std::string VarOption::metavar() const {
    if (metavar_.has_value()) return *metavar_;
    return utils::toUpper(name_);
}

std::string VarOption::description() const {
    if (description_.has_value()) return *description_;
    switch (type_) {
        case OptionType::Bool: return "A bool option for '" + name_ + "'";
        case OptionType::Enum: return "An enum option for '" + name_ + "'";
        case OptionType::Anything: return "An unchecked option for '" + name_ + "'";
        case OptionType::List:
            return "A repeatable (cumulative) '" + std::string(optionTypeName(elementType_)) + "' list option for '" +
                   name_ + "'";
        default: break;
    }
    return "A " + std::string(optionTypeName(type_)) + " option for '" + name_ + "'";
}

std::vector<std::string> FlagOption::listValues() const {
    if (value_.empty()) return {};
    return utils::split(value_, ',');
}

} // namespace srelvis
