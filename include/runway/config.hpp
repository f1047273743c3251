#pragma once

#include "utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace runway {

    using namespace std::string_view_literals;

    /*
     * Runway Startup Config Options
     *
     * Target selection
     * - environment: Named deployment environment (staging|production).
     * - gcloud_path: Build/deploy tool executable; bare names are resolved on PATH.
     * - source_dir: Build context submitted to the image build backend.
     *
     * UX
     * - color: ANSI color behavior for terminal output.
     * - quiet/verbose: Coarse output verbosity knobs; verbose echoes every external command.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print the resolved deployment profile and exit without side effects.
     *
     * Process-wide configuration (process_config) is read once from the environment:
     * - GCP_PROJECT_ID: Project namespace for builds and deploys (default: shopify-473015).
     * - GCP_REGION: Region of the managed service (default: us-central1).
     * - NO_COLOR: Disables color under color=auto.
     */

    enum class environment_name : uint8_t { staging, production };
    enum class log_level : uint8_t { info, warning, error };
    enum class color_mode : uint8_t { automatic, always, never };

    // Process exit contract: 0/1/2 keep their conventional meanings for wrapping scripts
    enum class exit_code : int {
        success = 0,
        failure = 1,
        usage = 2,
        precondition = 3,
    };

    inline constexpr int to_int(exit_code code) {
        return static_cast<int>(code);
    }

    inline constexpr std::string_view to_string(environment_name env) {
        switch (env) {
            case environment_name::staging:
                return "staging"sv;
            case environment_name::production:
                return "production"sv;
        }
        return "staging"sv;
    }

    // Exact lowercase tokens only; "Staging" or "" are rejected like any other unknown name
    inline constexpr bool try_parse_environment(std::string_view text, environment_name& out) {
        if (text == "staging"sv) {
            out = environment_name::staging;
            return true;
        }
        if (text == "production"sv) {
            out = environment_name::production;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::info:
                return "INFO"sv;
            case log_level::warning:
                return "WARNING"sv;
            case log_level::error:
                return "ERROR"sv;
        }
        return "INFO"sv;
    }

    inline constexpr log_level most_verbose_log_level = log_level::info;

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr bool resolve_color(color_mode mode, bool stdout_is_tty, bool no_color_env) {
        switch (mode) {
            case color_mode::always:
                return true;
            case color_mode::never:
                return false;
            case color_mode::automatic:
                return stdout_is_tty && !no_color_env;
        }
        return false;
    }

    namespace env_var {
        inline constexpr auto project_id = "GCP_PROJECT_ID"sv;
        inline constexpr auto region = "GCP_REGION"sv;
        inline constexpr auto no_color = "NO_COLOR"sv;
    }  // namespace env_var

    namespace defaults {
        inline constexpr auto project_id = "shopify-473015"sv;
        inline constexpr auto region = "us-central1"sv;
    }  // namespace defaults

    using env_lookup = const char* (*)(const char*);

    inline const char* process_env(const char* name) {
        return std::getenv(name);
    }

    struct process_config {
        std::string project_id{defaults::project_id};
        std::string region{defaults::region};
        bool no_color{false};

        // Unset and empty variables both fall back to the documented defaults
        static process_config from_environment(env_lookup lookup = &process_env) {
            process_config cfg{};
            if (auto* value = lookup(env_var::project_id.data()); value != nullptr && *value != '\0') {
                cfg.project_id = value;
            }
            if (auto* value = lookup(env_var::region.data()); value != nullptr && *value != '\0') {
                cfg.region = value;
            }
            if (auto* value = lookup(env_var::no_color.data()); value != nullptr && *value != '\0') {
                cfg.no_color = true;
            }
            return cfg;
        }
    };

    struct startup_config {
        environment_name environment{environment_name::staging};
        std::filesystem::path gcloud_path{"gcloud"};
        std::filesystem::path source_dir{"."};

        color_mode color{color_mode::automatic};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace runway
