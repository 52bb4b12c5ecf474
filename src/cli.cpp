#include "peatgrid/cli.hpp"
#include "peatgrid/logging.hpp"

#include <ostream>

namespace peatgrid {

    namespace {
        void describe(std::ostream &os, const Algorithm &algorithm) {
            auto d = algorithm.describe();
            os << d.id << " - " << d.display_name << "\n  " << d.help << "\n";
            for (const auto &p : algorithm.declareInputs()) {
                os << "  " << p.name << ": " << p.description;
                if (p.optional)
                    os << " (optional)";
                if (!p.default_value.empty())
                    os << " [default " << p.default_value << "]";
                os << "\n";
            }
        }

        const Algorithm &findOrThrow(const Provider &provider, const std::string &id) {
            const auto *algorithm = provider.find(id);
            if (!algorithm)
                throw UsageError("unknown algorithm '" + id + "'");
            return *algorithm;
        }
    } // namespace

    void printUsage(std::ostream &os) {
        os << "usage: peatgrid --list\n"
           << "       peatgrid --help <algorithm>\n"
           << "       peatgrid [--verbose] <algorithm> KEY=VALUE...\n";
    }

    CommandLine parseCommandLine(int argc, const char *const *argv) {
        CommandLine cmd;

        int i = 1;
        if (i < argc && std::string(argv[i]) == "--verbose") {
            cmd.verbose = true;
            ++i;
        }
        if (i >= argc)
            throw UsageError("missing command");

        std::string command = argv[i++];
        if (command == "--list") {
            cmd.action = CommandLine::Action::List;
        } else if (command == "--help") {
            if (i >= argc)
                throw UsageError("--help needs an algorithm id");
            cmd.action = CommandLine::Action::Help;
            cmd.algorithm = argv[i++];
        } else {
            cmd.action = CommandLine::Action::Run;
            cmd.algorithm = command;
            for (; i < argc; ++i) {
                std::string arg = argv[i];
                auto eq = arg.find('=');
                if (eq == std::string::npos || eq == 0)
                    throw UsageError("expected KEY=VALUE, got '" + arg + "'");
                cmd.parameters[arg.substr(0, eq)] = arg.substr(eq + 1);
            }
            return cmd;
        }

        if (i < argc)
            throw UsageError("unexpected argument '" + std::string(argv[i]) + "'");
        return cmd;
    }

    int runCommandLine(int argc, const char *const *argv, const Provider &provider, Feedback &feedback,
                       std::ostream &out, std::ostream &err) {
        CommandLine cmd;
        const Algorithm *algorithm = nullptr;
        try {
            cmd = parseCommandLine(argc, argv);
            if (cmd.action != CommandLine::Action::List)
                algorithm = &findOrThrow(provider, cmd.algorithm);
        } catch (const UsageError &e) {
            err << e.what() << "\n";
            printUsage(err);
            return EXIT_USAGE;
        }

        if (cmd.verbose)
            setLogLevel(spdlog::level::debug);

        switch (cmd.action) {
        case CommandLine::Action::List:
            out << provider.name() << " (" << provider.id() << ")\n";
            for (const auto &a : provider.algorithms())
                describe(out, *a);
            return EXIT_OK;
        case CommandLine::Action::Help:
            describe(out, *algorithm);
            return EXIT_OK;
        case CommandLine::Action::Run:
            break;
        }

        try {
            auto outputs = algorithm->run(cmd.parameters, feedback);
            for (const auto &[key, value] : outputs)
                out << key << "=" << value << "\n";
        } catch (const Error &e) {
            feedback.reportError(e.what());
            return EXIT_RUN_FAILED;
        } catch (const std::exception &e) {
            feedback.reportError(std::string("unexpected failure: ") + e.what());
            return EXIT_RUN_FAILED;
        }
        if (feedback.isCanceled())
            logger()->info("run canceled");
        return EXIT_OK;
    }

} // namespace peatgrid
