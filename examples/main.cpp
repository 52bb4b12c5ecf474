#include "peatgrid/cli.hpp"
#include "peatgrid/peatgrid.hpp"

#include <csignal>
#include <iostream>

namespace {

    peatgrid::LoggingFeedback *active_feedback = nullptr;

    void onInterrupt(int) {
        if (active_feedback)
            active_feedback->cancel();
    }

} // namespace

int main(int argc, char **argv) {
    peatgrid::Provider provider;
    peatgrid::LoggingFeedback feedback;
    active_feedback = &feedback;
    std::signal(SIGINT, onInterrupt);

    return peatgrid::runCommandLine(argc, argv, provider, feedback, std::cout, std::cerr);
}
