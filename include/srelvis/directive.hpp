#ifndef SRELVIS_DIRECTIVE_HPP
#define SRELVIS_DIRECTIVE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "option.hpp"

namespace srelvis {

enum class DirectiveType {
    YesNo,
    Enum,
    Anything,
    List,
    Special,
    Flag,
    Alias,
    Map,
    ListMap,
    Inline,
    ListInline,
    Collapse,
    Metavar,
    Describe,
};

// The spelling used on the command line (`--enum`, `--list-map`, ...) without dashes.
std::string_view directiveTypeName(DirectiveType type);
std::optional<DirectiveType> parseDirectiveType(std::string_view name);

// One directive as collected by the command line: a type tag and the unparsed text.
struct RawDirective {
    DirectiveType type;
    std::string text;
};

struct BoolDecl {
    std::string name;
    bool defaultValue{false};
};

struct EnumDecl {
    std::string name;
    std::string defaultValue;
    std::vector<std::string> values;
};

struct AnythingDecl {
    std::string name;
    std::string defaultValue;
};

struct ListDecl {
    std::string name;
    OptionType elementType{OptionType::Anything};
    std::vector<std::string> defaults;
    std::vector<std::string> values;
};

struct SpecialDecl {
    SpecialKind kind{SpecialKind::Results};
};

struct FlagDecl {
    std::string name;
    std::string target;
    std::string value;
};

struct AliasDecl {
    std::string name;
    std::string target;
    OptionType targetType{OptionType::Bool};
};

struct MapDecl {
    std::string variable;
    std::string parameter;
    bool urlEncode{true};
};

struct InlineDecl {
    std::string variable;
    std::string keyword;
};

struct CollapseDecl {
    std::string variable;
    std::vector<CollapseBranch> branches;
};

struct MetavarDecl {
    std::string variable;
    std::string metavar;  // upper-cased
};

struct DescribeDecl {
    std::string variable;
    std::string description;
};

using DirectivePayload = std::variant<BoolDecl,
                                      EnumDecl,
                                      AnythingDecl,
                                      ListDecl,
                                      SpecialDecl,
                                      FlagDecl,
                                      AliasDecl,
                                      MapDecl,
                                      InlineDecl,
                                      CollapseDecl,
                                      MetavarDecl,
                                      DescribeDecl>;

struct Directive {
    DirectiveType type;
    std::size_t index{0};  // position in the original directive sequence
    DirectivePayload payload;
};

// Expected grammar of a directive type, as shown in error messages.
std::string_view directiveGrammar(DirectiveType type);

// Splits `raw.text` on ':' (fields) and ',' (list items) and checks each field.
// Throws CompileError(MalformedDirective) naming the offending field and the expected grammar.
// Delimiters cannot be escaped: a ':' or ',' inside a value is always a separator.
Directive parseDirective(const RawDirective& raw, std::size_t index);

std::vector<Directive> parseDirectives(const std::vector<RawDirective>& raws);

} // namespace srelvis

#endif // SRELVIS_DIRECTIVE_HPP
