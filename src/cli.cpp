#include "runway/cli.hpp"

#include "runway/console.hpp"
#include "runway/pipeline.hpp"
#include "runway/profile.hpp"
#include "runway/report.hpp"

#include "internal/editor.hpp"
#include "internal/http.hpp"
#include "internal/platform.hpp"
#include "internal/subprocess.hpp"

#include <CLI/CLI.hpp>

extern "C" {
#include <unistd.h>
}

#include <iostream>
#include <string>

namespace runway::cli {

    namespace detail {

        static void print_usage(std::ostream& os) {
            os << "Usage: runway [staging|production]\n";
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"runway: build and deploy the merchant onboarding service to Cloud Run"};

        bool show_version = false;
        std::string env_arg{std::string{to_string(cfg.environment)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        std::string gcloud_arg{cfg.gcloud_path.string()};
        std::string source_arg{cfg.source_dir.string()};

        app.add_option("environment", env_arg, "Target environment: staging|production (default: staging)");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--gcloud", gcloud_arg, "gcloud executable (name on PATH or path)");
        app.add_option("--source", source_arg, "Build context directory submitted to Cloud Build");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print the resolved deployment profile and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress output");
        app.add_flag("--verbose", cfg.verbose, "Echo every external command before running it");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "runway " << internal::platform::version << '\n';
            return std::optional<int>{to_int(exit_code::success)};
        }

        if (!try_parse_environment(env_arg, cfg.environment)) {
            std::cerr << "Error: Invalid environment '" << env_arg << "'\n";
            detail::print_usage(std::cerr);
            return std::optional<int>{to_int(to_exit_code(error_kind::usage))};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{to_int(to_exit_code(error_kind::usage))};
        }

        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{to_int(to_exit_code(error_kind::usage))};
        }
        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (gcloud_arg.empty()) {
            std::cerr << "--gcloud must not be empty\n";
            return std::optional<int>{to_int(to_exit_code(error_kind::usage))};
        }
        cfg.gcloud_path = gcloud_arg;
        cfg.source_dir = source_arg.empty() ? std::string{"."} : source_arg;

        return std::nullopt;
    }

    int execute(const startup_config& cfg, const process_config& process, run_context ctx) {
        auto profile = resolve_profile(cfg.environment, process);

        if (cfg.print_config) {
            report::render_preview(ctx.out, profile, ctx.style);
            return to_int(exit_code::success);
        }

        console con{ctx.out, ctx.err, ctx.style, make_verbosity(cfg.quiet, cfg.verbose)};
        pipeline_options options{.tool = cfg.gcloud_path, .source_dir = cfg.source_dir};

        deploy_pipeline pipeline{profile, std::move(options), ctx.io, con};
        auto result = pipeline.run();
        return to_int(result.code);
    }

    int run(const startup_config& cfg, const process_config& process) {
        internal::curl_global_guard curl_guard{};

        internal::system_runner runner{};
        internal::terminal_prompter prompt{cfg.color, std::cin, std::cout};
        internal::curl_prober prober{};
        internal::thread_sleeper sleep{};

        console_style style{
                .color = resolve_color(cfg.color, ::isatty(STDOUT_FILENO) == 1, process.no_color)};

        return execute(
                cfg,
                process,
                run_context{
                        .io = collaborators{.runner = runner, .prompt = prompt, .prober = prober, .sleep = sleep},
                        .out = std::cout,
                        .err = std::cerr,
                        .style = style});
    }

}  // namespace runway::cli
