// =============================================================================
// cli.hpp - Command-Line Front End
// =============================================================================
// Command dispatch for the lambdalang executable. main() forwards to run()
// with the process streams; tests call it with string streams.
//
// Exit codes: kExitOk on success, kExitUsage for unknown commands or
// missing arguments, kExitConfig when configuration or the vocabulary
// cannot be loaded.
// =============================================================================

#pragma once

#include <iosfwd>

namespace lambdalang::cli {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;

// argv[0] is the program name, as passed to main()
int run(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err);

} // namespace lambdalang::cli
