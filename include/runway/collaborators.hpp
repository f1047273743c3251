#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runway {

    struct command {
        std::vector<std::string> args{};

        std::string to_string() const { return utils::join_with_separator(args, " "); }
    };

    struct command_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};

        bool ok() const { return exit_code == 0; }
    };

    enum class io_mode : uint8_t {
        // stdout/stderr collected into the result
        captured,
        // child shares the terminal; used for long-running and interactive tool steps
        inherited,
    };

    /*
     * Seams to everything outside the process. The pipeline only talks to these; production
     * implementations live under src/internal and tests substitute scripted ones.
     */
    class command_runner {
      public:
        virtual ~command_runner() = default;

        virtual std::optional<std::filesystem::path> find_tool(const std::filesystem::path& tool) = 0;
        virtual command_result run(const command& cmd, io_mode mode) = 0;
    };

    class prompter {
      public:
        virtual ~prompter() = default;

        // std::nullopt on end of input
        virtual std::optional<std::string> prompt(std::string_view question) = 0;
    };

    class http_prober {
      public:
        virtual ~http_prober() = default;

        virtual bool probe(const std::string& url) = 0;
    };

    class sleeper {
      public:
        virtual ~sleeper() = default;

        virtual void sleep_for(std::chrono::milliseconds delay) = 0;
    };

    struct collaborators {
        command_runner& runner;
        prompter& prompt;
        http_prober& prober;
        sleeper& sleep;
    };

}  // namespace runway
