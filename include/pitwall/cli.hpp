#pragma once
#include <pitwall/config.hpp>

namespace pitwall::cli {

struct Parsed {
  PipelineConfig config{};
  bool exit_now = false;   // --help, or a parse error already reported
  int exit_code = 0;
};

// Parses the command line (and a --config file if given) into a validated
// PipelineConfig. Throws ConfigError for values CLI11 accepts but the
// pipeline does not (unknown priority rule, inconsistent settings).
Parsed configure(int argc, const char* const* argv);

} // namespace pitwall::cli
