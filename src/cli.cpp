#include "srelvis/cli.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <utility>

#include <sys/stat.h>
#include <sysexits.h>
#include <unistd.h>

#include "srelvis/color.hpp"
#include "srelvis/compiler.hpp"
#include "srelvis/diag.hpp"
#include "srelvis/error.hpp"
#include "srelvis/parser.hpp"
#include "srelvis/version.hpp"

namespace {

using srelvis::DirectiveType;

// "--list-map" -> ListMap. Settings and ambient flags are not directives.
std::optional<DirectiveType> directiveFor(const std::string& key) {
    if (key.rfind("--", 0) != 0) return std::nullopt;
    return srelvis::parseDirectiveType(std::string_view(key).substr(2));
}

std::string errnoMessage(const std::string& what) { return what + ": " + std::strerror(errno); }

bool writeAll(int fd, const std::string& content) {
    const char* p = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        const auto n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

namespace srelvis::cli {

const std::vector<Flag>& flags() {
    static const std::vector<Flag> all = [] {
        std::vector<Flag> f;
        // Directives
        f.emplace_back("--flag", "-F", "define a flag (an alias with a value)", "NAME:TARGET:VALUE", std::string());
        f.emplace_back("--yes-no", "-Y", "define a boolean option", "NAME:yes|no", std::string());
        f.emplace_back("--bool", "", "same as --yes-no", "NAME:yes|no", std::string());
        f.back().setHidden(true);
        f.emplace_back("--enum", "-E", "define an option with a fixed set of values", "NAME:DEFAULT:V1,V2,...",
                       std::string());
        f.emplace_back("--anything", "-A", "define an unchecked option", "NAME:DEFAULT", std::string());
        f.emplace_back("--alias", "", "define an alias to an option or a flag", "NAME:TARGET:TYPE", std::string());
        f.emplace_back("--list", "", "define a repeatable (cumulative) option",
                       "NAME:enum|anything:D1,D2,...[:V1,V2,...]", std::string());
        f.emplace_back("--map", "", "map a variable to a URL parameter", "VARIABLE:PARAMETER[:yes|no]",
                       std::string());
        f.emplace_back("--list-map", "", "map each item of a list to a URL parameter", "VARIABLE:PARAMETER[:yes|no]",
                       std::string());
        f.emplace_back("--inline", "", "add KEYWORD:VALUE to the search terms", "VARIABLE:KEYWORD", std::string());
        f.emplace_back("--list-inline", "", "add KEYWORD:ITEM to the search terms for each list item",
                       "VARIABLE:KEYWORD", std::string());
        f.emplace_back("--collapse", "", "rewrite values of a variable; the first matching group wins",
                       "VARIABLE:V1,V2,RESULT[:VA,VB,RESULT2...]", std::string());
        f.emplace_back("--metavar", "", "set the metavar of an option (shown upper-cased)", "VARIABLE:METAVAR",
                       std::string());
        f.emplace_back("--describe", "", "set the -local-help description of an option", "VARIABLE:DESCRIPTION",
                       std::string());
        f.emplace_back("--use-results-option", "", "define a -results=NUM option", "", false);
        f.emplace_back("--use-language-option", "", "define a -language=ISOCODE option", "", false);
        // Elvis settings
        f.emplace_back("--description", "", "description of the elvis (default: \"Search NAME\")", "DESCRIPTION",
                       std::string());
        f.emplace_back("--query-parameter", "-Q", "URL parameter that carries the search terms", "PARAMETER",
                       std::string());
        f.emplace_back("--no-append-args", "", "do not append the search terms to the search URL", "", false);
        f.emplace_back("--insecure", "", "default to http instead of https", "", false);
        f.emplace_back("--no-completions", "", "do not generate completion hooks", "", false);
        f.emplace_back("--num-tabs", "", "tabs after the elvis name in the '# elvis:' line", "N", 1);
        f.emplace_back("--output", "-o", "output file, - for stdout (default: the elvis name)", "FILE",
                       std::string());
        f.emplace_back("--bash-completion", "", "write a bash completion file (default: NAME.completion) instead",
                       "", false);
        // Ambient
        f.emplace_back("--verbose", "-v", "more output; repeat for debug output", "", 0);
        f.back().setCount(true);
        f.emplace_back("--quiet", "-q", "only report errors", "", false);
        f.emplace_back("--color", "", "colour diagnostics: auto, always or never", "WHEN", std::string("auto"));
        return f;
    }();
    return all;
}

void printUsage(std::ostream& os) {
    os << "Usage:\n";
    os << "  " << kProgram << " NAME BASE_URL SEARCH_URL [flags]\n\n";
    os << "Generate a surfraw elvis named NAME.\n\n";
    os << "Flags:\n";

    std::vector<std::pair<std::string, std::string>> rows;
    for (const auto& f : flags()) {
        if (f.hidden()) continue;
        std::string names = f.shortName().empty() ? "    " : f.shortName() + ", ";
        names += f.longName();
        if (!f.varName().empty()) names += " " + f.varName();
        rows.emplace_back(std::move(names), f.description());
    }
    rows.emplace_back("-h, --help", "help for " + std::string(kProgram));
    rows.emplace_back("    --version", "print the version and exit");

    std::size_t width = 0;
    for (const auto& r : rows) width = std::max(width, r.first.size());
    for (const auto& r : rows) {
        os << "  " << r.first << std::string(width - r.first.size() + 3, ' ') << r.second << "\n";
    }
}

std::optional<std::string> writeElvis(const std::string& path,
                                      const std::string& name,
                                      const std::string& content,
                                      unsigned mode) {
    const auto slash = path.rfind('/');
    std::string dir = ".";
    if (slash != std::string::npos) dir = slash == 0 ? "/" : path.substr(0, slash);

    const std::string suffix = std::string(".") + kProgram + ".tmp";
    std::string tmpl = dir + "/" + name + ".XXXXXX" + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) return errnoMessage("cannot create a temporary file in '" + dir + "'");
    const std::string tmpPath(buf.data());

    if (!writeAll(fd, content) || ::fsync(fd) != 0 || ::fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        auto msg = errnoMessage("cannot write '" + tmpPath + "'");
        ::close(fd);
        return msg;
    }
    if (::close(fd) != 0) return errnoMessage("cannot write '" + tmpPath + "'");
    if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
        return errnoMessage("cannot rename '" + tmpPath + "' to '" + path + "'");
    }
    return std::nullopt;
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    Diagnostics diag(err, kProgram, Level::Warning, color::enabled(ColorMode::Auto, color::Stream::Stderr));

    const Parser parser(args, flags());
    if (!parser.ok()) {
        diag.error(parser.error());
        err << "Run '" << kProgram << " --help' for usage.\n";
        return EX_USAGE;
    }

    const auto mode = color::parseMode(parser.getFlag<std::string>("--color", "auto"));
    if (!mode.has_value()) {
        diag.error("invalid argument \"" + parser.getFlag<std::string>("--color") +
                   "\" for \"--color\"; must be auto, always or never");
        return EX_USAGE;
    }
    diag.setColor(color::enabled(*mode, color::Stream::Stderr));
    diag.setThreshold(levelFromVerbosity(parser.getCount("--verbose"), parser.getFlag<bool>("--quiet", false)));

    if (parser.getFlag<bool>("--help", false)) {
        printUsage(out);
        return EX_OK;
    }
    if (parser.getFlag<bool>("--version", false)) {
        out << kProgram << " (srelvis) " << SRELVIS_VERSION << "\n";
        return EX_OK;
    }

    const auto& positionals = parser.positionals();
    if (positionals.size() != 3) {
        diag.error("expected NAME BASE_URL SEARCH_URL, got " + std::to_string(positionals.size()) + " argument" +
                   (positionals.size() == 1 ? "" : "s"));
        err << "Run '" << kProgram << " --help' for usage.\n";
        return EX_USAGE;
    }

    ElvisConfig config;
    config.name = positionals[0];
    config.baseUrl = positionals[1];
    config.searchUrl = positionals[2];
    config.generator = kProgram;
    if (parser.hasFlag("--description")) config.description = parser.getFlag<std::string>("--description");
    if (parser.hasFlag("--query-parameter")) config.queryParameter = parser.getFlag<std::string>("--query-parameter");
    config.appendSearchArgs = !parser.getFlag<bool>("--no-append-args", false);
    config.enableCompletions = !parser.getFlag<bool>("--no-completions", false);
    config.insecure = parser.getFlag<bool>("--insecure", false);
    config.numTabs = parser.getFlag<int>("--num-tabs", 1);

    std::vector<RawDirective> directives;
    for (const auto& occ : parser.ordered()) {
        if (occ.key == "--use-results-option" || occ.key == "--use-language-option") {
            if (occ.value != "true") continue;
            directives.push_back(
                RawDirective{DirectiveType::Special, occ.key == "--use-results-option" ? "results" : "language"});
            continue;
        }
        if (const auto type = directiveFor(occ.key)) directives.push_back(RawDirective{*type, occ.value});
    }
    diag.debug("compiling " + std::to_string(directives.size()) + " directive" +
               (directives.size() == 1 ? "" : "s") + " for '" + config.name + "'");

    const bool completion = parser.getFlag<bool>("--bash-completion", false);
    std::string content;
    try {
        content = completion ? compileBashCompletion(config, directives) : kShebang + compile(config, directives);
    } catch (const CompileError& e) {
        diag.error(e.describe());
        diag.debug(std::string(errorKindName(e.kind())));
        return EX_USAGE;
    }

    const auto fallback = completion ? config.name + ".completion" : config.name;
    const auto output = parser.hasFlag("--output") ? parser.getFlag<std::string>("--output") : fallback;
    if (output == "-") {
        out << content;
        out.flush();
        if (!out) {
            diag.error("cannot write to standard output");
            return EX_OSERR;
        }
        return EX_OK;
    }

    if (const auto failure = writeElvis(output, config.name, content, completion ? 0644 : 0755)) {
        diag.error(*failure);
        return EX_OSERR;
    }
    diag.info("wrote '" + output + "'");
    return EX_OK;
}

int run(int argc, char** argv, std::ostream& out, std::ostream& err) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args, out, err);
}

} // namespace srelvis::cli
