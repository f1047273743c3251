#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "format.hpp"

#include <optional>
#include <ostream>

namespace runway::cli {

    struct run_context {
        collaborators io;
        std::ostream& out;
        std::ostream& err;
        console_style style{};
    };

    // std::nullopt to continue, otherwise the exit status of a one-shot or rejected invocation
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    int execute(const startup_config& cfg, const process_config& process, run_context ctx);

    // execute() wired to gcloud, libcurl and the controlling terminal
    int run(const startup_config& cfg, const process_config& process);

}  // namespace runway::cli
