#include "srelvis/directive.hpp"

#include <utility>

#include "srelvis/error.hpp"
#include "srelvis/utils.hpp"
#include "srelvis/validation.hpp"

namespace {

using srelvis::CompileError;
using srelvis::DirectiveType;
using srelvis::ErrorKind;

// Positional view over one directive's colon-delimited fields.
class Fields {
public:
    Fields(const srelvis::RawDirective& raw, std::size_t index)
        : raw_(raw), index_(index), fields_(srelvis::utils::split(raw.text, ':')) {}

    void requireCount(std::size_t minCount, std::size_t maxCount) const {
        if (fields_.size() >= minCount && fields_.size() <= maxCount) return;
        std::string msg = "'" + raw_.text + "' has " + std::to_string(fields_.size()) + " colon-delimited field";
        if (fields_.size() != 1) msg += "s";
        fail(std::move(msg));
    }

    [[nodiscard]] std::size_t size() const { return fields_.size(); }
    [[nodiscard]] std::size_t index() const { return index_; }
    [[nodiscard]] const std::string& at(std::size_t i) const { return fields_.at(i); }

    // A name that declares something (option, flag, alias).
    std::string declaredName(std::size_t i) const {
        const auto& name = fields_.at(i);
        checkName(name);
        if (srelvis::isReservedName(name)) {
            fail("option name '" + name + "' is global, which cannot be overridden by elvi");
        }
        return name;
    }

    // A name that refers to something declared elsewhere.
    std::string referenceName(std::size_t i) const {
        const auto& name = fields_.at(i);
        checkName(name);
        return name;
    }

    bool yesNo(std::size_t i) const {
        bool out = false;
        if (!srelvis::tryParseYesNo(fields_.at(i), out)) {
            fail("bool '" + fields_.at(i) + "' must be one of the following: no, yes");
        }
        return out;
    }

    std::string enumValue(std::size_t i) const {
        checkEnumValue(fields_.at(i));
        return fields_.at(i);
    }

    // Comma-separated items; an empty field is an empty list, empty items are kept otherwise.
    std::vector<std::string> list(std::size_t i) const {
        if (fields_.at(i).empty()) return {};
        return srelvis::utils::split(fields_.at(i), ',');
    }

    std::vector<std::string> enumValues(std::size_t i) const {
        auto values = list(i);
        for (std::size_t a = 0; a < values.size(); ++a) {
            checkEnumValue(values[a]);
            for (std::size_t b = 0; b < a; ++b) {
                if (values[a] == values[b]) fail("enum value '" + values[a] + "' is listed more than once");
            }
        }
        return values;
    }

    [[noreturn]] void fail(std::string what) const {
        what += "; ";
        what += srelvis::directiveTypeName(raw_.type);
        what += " requires ";
        what += srelvis::directiveGrammar(raw_.type);
        throw CompileError(ErrorKind::MalformedDirective,
                           std::move(what),
                           index_,
                           std::string(srelvis::directiveTypeName(raw_.type)));
    }

private:
    void checkName(const std::string& name) const {
        if (!srelvis::isValidName(name)) fail("name '" + name + "' is an invalid variable name for an elvis");
    }

    void checkEnumValue(const std::string& value) const {
        if (!srelvis::isValidEnumValue(value)) {
            fail("enum value '" + value + "' must match the regex '" + std::string(srelvis::kEnumValuePattern) + "'");
        }
    }

    const srelvis::RawDirective& raw_;
    std::size_t index_;
    std::vector<std::string> fields_;
};

srelvis::DirectivePayload parsePayload(const srelvis::RawDirective& raw, const Fields& f) {
    using namespace srelvis;
    switch (raw.type) {
        case DirectiveType::YesNo: {
            f.requireCount(2, 2);
            return BoolDecl{f.declaredName(0), f.yesNo(1)};
        }
        case DirectiveType::Enum: {
            f.requireCount(3, 3);
            return EnumDecl{f.declaredName(0), f.enumValue(1), f.enumValues(2)};
        }
        case DirectiveType::Anything: {
            f.requireCount(2, 2);
            return AnythingDecl{f.declaredName(0), f.at(1)};
        }
        case DirectiveType::List: {
            f.requireCount(3, 4);
            ListDecl d;
            d.name = f.declaredName(0);
            const auto type = parseOptionType(f.at(1));
            if (!type.has_value() || (*type != OptionType::Enum && *type != OptionType::Anything)) {
                f.fail("list type '" + f.at(1) + "' must be one of the following: anything, enum");
            }
            d.elementType = *type;
            d.defaults = f.list(2);
            if (d.elementType == OptionType::Enum) {
                if (f.size() < 4 || f.at(3).empty()) f.fail("enum lists must specify their valid values");
                d.values = f.enumValues(3);
            } else if (f.size() == 4) {
                f.fail("valid values may only be given for enum lists");
            }
            return d;
        }
        case DirectiveType::Special: {
            f.requireCount(1, 1);
            const auto kind = parseSpecialKind(f.at(0));
            if (!kind.has_value()) f.fail("'" + f.at(0) + "' is an unsupported special option");
            return SpecialDecl{*kind};
        }
        case DirectiveType::Flag: {
            f.requireCount(3, 3);
            return FlagDecl{f.declaredName(0), f.referenceName(1), f.at(2)};
        }
        case DirectiveType::Alias: {
            f.requireCount(3, 3);
            AliasDecl d{f.declaredName(0), f.referenceName(1), OptionType::Bool};
            const auto type = parseOptionType(f.at(2));
            if (type == OptionType::Alias) {
                throw CompileError(ErrorKind::InvalidAliasChain,
                                   "alias '" + d.name + "' may not target another alias",
                                   f.index(),
                                   std::string(directiveTypeName(raw.type)));
            }
            if (!type.has_value()) {
                f.fail("alias type '" + f.at(2) +
                       "' must be one of the following: anything, bool, enum, flag, list, special, yes-no");
            }
            d.targetType = *type;
            return d;
        }
        case DirectiveType::Map:
        case DirectiveType::ListMap: {
            f.requireCount(2, 3);
            MapDecl d{f.referenceName(0), f.at(1), true};
            if (d.parameter.empty()) f.fail("URL parameter must not be empty");
            if (f.size() == 3) d.urlEncode = f.yesNo(2);
            return d;
        }
        case DirectiveType::Inline:
        case DirectiveType::ListInline: {
            f.requireCount(2, 2);
            const auto& keyword = f.at(1);
            if (!isValidName(keyword)) f.fail("keyword '" + keyword + "' must match the regex '^[a-z]+$'");
            return InlineDecl{f.referenceName(0), keyword};
        }
        case DirectiveType::Collapse: {
            f.requireCount(2, static_cast<std::size_t>(-1));
            CollapseDecl d;
            d.variable = f.referenceName(0);
            for (std::size_t i = 1; i < f.size(); ++i) {
                auto items = utils::split(f.at(i), ',');
                if (items.size() < 2) {
                    f.fail("collapse group '" + f.at(i) + "' needs at least one value and a result");
                }
                CollapseBranch branch;
                branch.replacement = std::move(items.back());
                items.pop_back();
                branch.patterns = std::move(items);
                d.branches.push_back(std::move(branch));
            }
            return d;
        }
        case DirectiveType::Metavar: {
            f.requireCount(2, 2);
            if (!isValidMetavar(f.at(1))) f.fail("metavar '" + f.at(1) + "' must match the regex '^[a-z]+$'");
            return MetavarDecl{f.referenceName(0), utils::toUpper(f.at(1))};
        }
        case DirectiveType::Describe: {
            f.requireCount(2, 2);
            return DescribeDecl{f.referenceName(0), f.at(1)};
        }
    }
    f.fail("unknown directive type");
}

} // namespace

namespace srelvis {

std::string_view directiveTypeName(DirectiveType type) {
    switch (type) {
        case DirectiveType::YesNo: return "yes-no";
        case DirectiveType::Enum: return "enum";
        case DirectiveType::Anything: return "anything";
        case DirectiveType::List: return "list";
        case DirectiveType::Special: return "special";
        case DirectiveType::Flag: return "flag";
        case DirectiveType::Alias: return "alias";
        case DirectiveType::Map: return "map";
        case DirectiveType::ListMap: return "list-map";
        case DirectiveType::Inline: return "inline";
        case DirectiveType::ListInline: return "list-inline";
        case DirectiveType::Collapse: return "collapse";
        case DirectiveType::Metavar: return "metavar";
        case DirectiveType::Describe: return "describe";
    }
    return "yes-no";
}

std::optional<DirectiveType> parseDirectiveType(std::string_view name) {
    if (name == "yes-no" || name == "bool") return DirectiveType::YesNo;
    if (name == "enum") return DirectiveType::Enum;
    if (name == "anything") return DirectiveType::Anything;
    if (name == "list") return DirectiveType::List;
    if (name == "special") return DirectiveType::Special;
    if (name == "flag") return DirectiveType::Flag;
    if (name == "alias") return DirectiveType::Alias;
    if (name == "map") return DirectiveType::Map;
    if (name == "list-map") return DirectiveType::ListMap;
    if (name == "inline") return DirectiveType::Inline;
    if (name == "list-inline") return DirectiveType::ListInline;
    if (name == "collapse") return DirectiveType::Collapse;
    if (name == "metavar") return DirectiveType::Metavar;
    if (name == "describe") return DirectiveType::Describe;
    return std::nullopt;
}

std::string_view directiveGrammar(DirectiveType type) {
    switch (type) {
        case DirectiveType::YesNo: return "NAME:yes|no";
        case DirectiveType::Enum: return "NAME:DEFAULT:V1,V2,...";
        case DirectiveType::Anything: return "NAME:DEFAULT";
        case DirectiveType::List: return "NAME:enum|anything:D1,D2,...[:V1,V2,...]";
        case DirectiveType::Special: return "results|language";
        case DirectiveType::Flag: return "NAME:TARGET:VALUE";
        case DirectiveType::Alias: return "NAME:TARGET:TARGET_TYPE";
        case DirectiveType::Map:
        case DirectiveType::ListMap: return "VARIABLE:PARAMETER[:yes|no]";
        case DirectiveType::Inline:
        case DirectiveType::ListInline: return "VARIABLE:KEYWORD";
        case DirectiveType::Collapse: return "VARIABLE:V1,V2,RESULT[:VA,VB,RESULT2...]";
        case DirectiveType::Metavar: return "VARIABLE:METAVAR";
        case DirectiveType::Describe: return "VARIABLE:DESCRIPTION";
    }
    return "";
}

Directive parseDirective(const RawDirective& raw, std::size_t index) {
    const Fields fields(raw, index);
    return Directive{raw.type, index, parsePayload(raw, fields)};
}

std::vector<Directive> parseDirectives(const std::vector<RawDirective>& raws) {
    std::vector<Directive> out;
    out.reserve(raws.size());
    for (std::size_t i = 0; i < raws.size(); ++i) out.push_back(parseDirective(raws[i], i));
    return out;
}

} // namespace srelvis
