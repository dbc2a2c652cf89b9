#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"

namespace osmpbf_cli {

// Exit codes of osmpbf-scan
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;    // Bad arguments or configuration
constexpr int kExitReadError = 2; // Malformed input or scan policy violation

// Bad command line. The message names the offending argument.
class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &message)
      : std::runtime_error(message) {}
};

struct CliArgs {
  std::optional<std::string> config_path;
  osmpbf_reader::ReaderConfig config; // Inputs and scan flags from the command line
};

// Parse arguments (program name excluded).
// Throws UsageError on unknown options, missing or invalid values, and when
// inputs or scan flags are combined with --config.
CliArgs parse_args(const std::vector<std::string> &args);

// Runs osmpbf-scan: reports go to out, diagnostics to err.
// Returns one of the kExit* codes.
int run(const std::vector<std::string> &args, std::ostream &out,
        std::ostream &err);

} // namespace osmpbf_cli
