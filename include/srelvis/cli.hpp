#ifndef SRELVIS_CLI_HPP
#define SRELVIS_CLI_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "flag.hpp"

namespace srelvis::cli {

inline constexpr const char* kProgram = "mkelvis";
inline constexpr const char* kShebang = "#!/bin/sh\n";

// Every flag mkelvis understands, directive flags included.
const std::vector<Flag>& flags();

void printUsage(std::ostream& os);

// Writes `content` to `path` through a temporary file in the same directory, given `mode`
// (0755 for an elvis) and renamed over `path`. On failure the temporary file may be left behind
// for inspection. Returns an error message, or nullopt on success.
std::optional<std::string> writeElvis(const std::string& path,
                                      const std::string& name,
                                      const std::string& content,
                                      unsigned mode = 0755);

// Runs mkelvis on `args` (without the program name). Returns a sysexits.h code.
// The script (or with --bash-completion, the completion file) goes to `out` when the output
// file is "-"; diagnostics always go to `err`.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

int run(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace srelvis::cli

#endif // SRELVIS_CLI_HPP
