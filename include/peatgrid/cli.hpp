#pragma once

#include "peatgrid/algorithm.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/feedback.hpp"
#include "peatgrid/provider.hpp"

#include <iosfwd>
#include <string>

namespace peatgrid {

    // Malformed command line; reported with EXIT_USAGE.
    class UsageError : public Error {
      public:
        using Error::Error;
    };

    inline constexpr int EXIT_OK = 0;
    inline constexpr int EXIT_RUN_FAILED = 1;
    inline constexpr int EXIT_USAGE = 2;

    struct CommandLine {
        enum class Action { List, Help, Run };

        Action action = Action::List;
        bool verbose = false;
        std::string algorithm; // Help and Run
        Parameters parameters; // Run
    };

    // Accepts "--list", "--help <algorithm>" and "[--verbose] <algorithm> KEY=VALUE...". argv[0] is skipped.
    // Throws UsageError for anything else.
    CommandLine parseCommandLine(int argc, const char *const *argv);

    // Parses, dispatches to the provider and prints results to out. A canceled run still returns EXIT_OK.
    int runCommandLine(int argc, const char *const *argv, const Provider &provider, Feedback &feedback,
                       std::ostream &out, std::ostream &err);

    void printUsage(std::ostream &os);

} // namespace peatgrid
