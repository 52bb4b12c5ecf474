#include <doctest/doctest.h>

#include "peatgrid/cli.hpp"
#include "peatgrid/peatgrid.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {
    struct QuietFeedback : public peatgrid::Feedback {
        bool canceled = false;
        std::vector<std::string> errors;

        bool isCanceled() const override { return canceled; }
        void setProgress(int) override {}
        void pushInfo(const std::string &) override {}
        void reportError(const std::string &message) override { errors.push_back(message); }
    };

    std::vector<const char *> argvOf(const std::vector<std::string> &args) {
        std::vector<const char *> argv{"peatgrid"};
        for (const auto &a : args)
            argv.push_back(a.c_str());
        return argv;
    }

    peatgrid::CommandLine parse(const std::vector<std::string> &args) {
        auto argv = argvOf(args);
        return peatgrid::parseCommandLine(static_cast<int>(argv.size()), argv.data());
    }

    struct Invocation {
        int code;
        std::string out;
        std::string err;
    };

    Invocation invoke(const std::vector<std::string> &args, QuietFeedback &feedback) {
        peatgrid::Provider provider;
        std::ostringstream out, err;
        auto argv = argvOf(args);
        int code =
            peatgrid::runCommandLine(static_cast<int>(argv.size()), argv.data(), provider, feedback, out, err);
        return {code, out.str(), err.str()};
    }

    Invocation invoke(const std::vector<std::string> &args) {
        QuietFeedback feedback;
        return invoke(args, feedback);
    }

    std::string writeSite(const std::string &name) {
        std::string path = "/tmp/" + name;
        std::ofstream(path) << R"({
            "type": "FeatureCollection",
            "properties": {"crs": "EPSG:27700"},
            "features": [
                {"type": "Feature", "properties": {},
                 "geometry": {"type": "Polygon", "coordinates": [[[412000, 301000], [412300, 301000],
                                                                  [412300, 301300], [412000, 301300],
                                                                  [412000, 301000]]]}}
            ]
        })";
        return path;
    }
} // namespace

TEST_CASE("Cli - Parsing") {
    using Action = peatgrid::CommandLine::Action;

    SUBCASE("List") {
        auto cmd = parse({"--list"});
        CHECK(cmd.action == Action::List);
        CHECK_FALSE(cmd.verbose);
    }

    SUBCASE("Help names an algorithm") {
        auto cmd = parse({"--help", "peatpoints"});
        CHECK(cmd.action == Action::Help);
        CHECK(cmd.algorithm == "peatpoints");
        CHECK_THROWS_AS(parse({"--help"}), peatgrid::UsageError);
        CHECK_THROWS_AS(parse({"--help", "peatpoints", "extra"}), peatgrid::UsageError);
    }

    SUBCASE("Run with parameters") {
        auto cmd = parse({"--verbose", "peatpoints", "INPUT=site.geojson", "OUTPUT=a=b.geojson", "GRID50="});
        CHECK(cmd.action == Action::Run);
        CHECK(cmd.verbose);
        CHECK(cmd.algorithm == "peatpoints");
        CHECK(cmd.parameters.size() == 3);
        CHECK(cmd.parameters.at("INPUT") == "site.geojson");
        CHECK(cmd.parameters.at("OUTPUT") == "a=b.geojson");
        CHECK(cmd.parameters.at("GRID50").empty());
    }

    SUBCASE("Later values win") {
        auto cmd = parse({"peatpoints", "GRID50=true", "GRID50=false"});
        CHECK(cmd.parameters.at("GRID50") == "false");
    }

    SUBCASE("Malformed") {
        CHECK_THROWS_AS(parse({}), peatgrid::UsageError);
        CHECK_THROWS_AS(parse({"--verbose"}), peatgrid::UsageError);
        CHECK_THROWS_AS(parse({"peatpoints", "INPUT"}), peatgrid::UsageError);
        CHECK_THROWS_AS(parse({"peatpoints", "=x"}), peatgrid::UsageError);
    }
}

TEST_CASE("Cli - Exit codes") {
    SUBCASE("No arguments prints usage") {
        auto r = invoke({});
        CHECK(r.code == peatgrid::EXIT_USAGE);
        CHECK(r.err.find("usage: peatgrid") != std::string::npos);
        CHECK(r.out.empty());
    }

    SUBCASE("List shows both algorithms") {
        auto r = invoke({"--list"});
        CHECK(r.code == peatgrid::EXIT_OK);
        CHECK(r.out.find("peatlandspatial") != std::string::npos);
        CHECK(r.out.find("peatpoints") != std::string::npos);
        CHECK(r.out.find("peatlandcodeassessmentbase") != std::string::npos);
    }

    SUBCASE("Help describes parameters") {
        auto r = invoke({"--help", "peatpoints"});
        CHECK(r.code == peatgrid::EXIT_OK);
        CHECK(r.out.find("GRID50") != std::string::npos);
        CHECK(r.out.find("[default true]") != std::string::npos);
        CHECK(r.out.find("peatlandcodeassessmentbase") == std::string::npos);
    }

    SUBCASE("Unknown algorithm") {
        CHECK(invoke({"--help", "bogus"}).code == peatgrid::EXIT_USAGE);
        auto r = invoke({"bogus", "INPUT=x"});
        CHECK(r.code == peatgrid::EXIT_USAGE);
        CHECK(r.err.find("unknown algorithm 'bogus'") != std::string::npos);
    }

    SUBCASE("Bad KEY=VALUE") {
        auto r = invoke({"peatpoints", "INPUT"});
        CHECK(r.code == peatgrid::EXIT_USAGE);
        CHECK(r.err.find("expected KEY=VALUE, got 'INPUT'") != std::string::npos);
        CHECK(invoke({"peatpoints", "=x"}).code == peatgrid::EXIT_USAGE);
    }

    SUBCASE("Missing input fails the run") {
        QuietFeedback feedback;
        auto r = invoke({"peatpoints", "INPUT=/tmp/peatgrid_test_cli_missing.geojson",
                         "OUTPUT=/tmp/peatgrid_test_cli_missing_out.geojson"},
                        feedback);
        CHECK(r.code == peatgrid::EXIT_RUN_FAILED);
        CHECK(feedback.errors.size() == 1);
        CHECK(r.out.empty());
    }

    SUBCASE("Successful run prints outputs") {
        auto input = writeSite("peatgrid_test_cli_site.geojson");
        std::string output = "/tmp/peatgrid_test_cli_points.geojson";
        std::filesystem::remove(output);

        auto r = invoke({"peatpoints", "INPUT=" + input, "OUTPUT=" + output, "GRID50=false"});
        CHECK(r.code == peatgrid::EXIT_OK);
        CHECK(r.out.find("POINT_COUNT=") != std::string::npos);
        CHECK(r.out.find("OUTPUT=" + output) != std::string::npos);
        CHECK(std::filesystem::exists(output));

        std::filesystem::remove(input);
        std::filesystem::remove(output);
    }

    SUBCASE("Canceled run still succeeds") {
        auto input = writeSite("peatgrid_test_cli_canceled.geojson");
        std::string output = "/tmp/peatgrid_test_cli_canceled_points.geojson";

        QuietFeedback feedback;
        feedback.canceled = true;
        auto r = invoke({"peatpoints", "INPUT=" + input, "OUTPUT=" + output}, feedback);
        CHECK(r.code == peatgrid::EXIT_OK);
        CHECK(r.out.find("POINT_COUNT=0") != std::string::npos);
        CHECK(feedback.errors.empty());

        std::filesystem::remove(input);
        std::filesystem::remove(output);
    }
}
