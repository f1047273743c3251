#include "fakes.hpp"

namespace runway::test {

    namespace detail {
        static startup_config config_for(environment_name env) {
            startup_config cfg{};
            cfg.environment = env;
            cfg.color = color_mode::never;
            return cfg;
        }
    }  // namespace detail

    TEST_CASE("008: staging deploys without asking for confirmation", "[008][pipeline]") {
        harness h{"https://merchant-onboarding-api-staging-abc-uc.a.run.app"};

        auto code = cli::execute(detail::config_for(environment_name::staging), process_config{}, h.context());

        CHECK(code == 0);
        CHECK(h.prompt.questions.empty());
        CHECK(h.runner.builds() == 1U);
        CHECK(h.runner.deploys() == 1U);
        CHECK(h.runner.describes() == 1U);
        CHECK(detail::contains(h.out.str(), "Deployment Complete!"));
        CHECK(detail::contains(h.out.str(), "URL:          https://merchant-onboarding-api-staging-abc-uc.a.run.app"));
    }

    TEST_CASE("008: verbosity shapes pipeline output", "[008][pipeline]") {
        SECTION("verbose echoes commands and reports probe attempts") {
            harness h{};
            auto cfg = detail::config_for(environment_name::staging);
            cfg.verbose = true;

            auto code = cli::execute(cfg, process_config{}, h.context());

            CHECK(code == 0);
            CHECK(detail::contains(h.out.str(), "=== Agent Builder - Cloud Run Deployment ===\n"));
            CHECK(detail::contains(h.out.str(), "+ /opt/google-cloud-sdk/bin/gcloud builds submit"));
            CHECK(detail::contains(h.out.str(), "Probe attempts: 1\n"));
        }

        SECTION("quiet drops the banner but keeps the summary") {
            harness h{};
            auto cfg = detail::config_for(environment_name::staging);
            cfg.quiet = true;

            auto code = cli::execute(cfg, process_config{}, h.context());

            CHECK(code == 0);
            CHECK_FALSE(detail::contains(h.out.str(), "Agent Builder"));
            CHECK_FALSE(detail::contains(h.out.str(), "Probe attempts"));
            CHECK(detail::contains(h.out.str(), "Deployment Complete!"));
        }
    }

    TEST_CASE("008: stages run in strict order", "[008][pipeline]") {
        harness h{};

        auto profile = resolve_profile(environment_name::staging, process_config{});
        console con{h.out, h.err, console_style{}, verbosity::normal};
        deploy_pipeline pipeline{profile, pipeline_options{}, h.io(), con};
        auto result = pipeline.run();

        REQUIRE(result.code == exit_code::success);
        REQUIRE(h.runner.commands.size() == 5U);
        CHECK(h.runner.commands[0].args[1] == "auth");
        CHECK(h.runner.commands[1].args[1] == "config");
        CHECK(h.runner.commands[2].args[1] == "builds");
        CHECK(h.runner.commands[3].args[2] == "deploy");
        CHECK(h.runner.commands[4].args[2] == "services");
        CHECK(h.runner.modes[4] == io_mode::captured);
        CHECK(h.prober.calls.front() == "https://merchant-onboarding-api-abc123-uc.a.run.app/health");
    }

    TEST_CASE("008: declined production confirmation exits cleanly with no side effects", "[008][pipeline]") {
        for (auto answer : {"no", "", "y", "yess"}) {
            harness h{};
            h.prompt.answers = {std::string{answer}};
            INFO("answer: '" << answer << "'");

            auto code = cli::execute(detail::config_for(environment_name::production), process_config{}, h.context());

            CHECK(code == 0);
            CHECK(h.prompt.questions.size() == 1U);
            CHECK(h.runner.lookups.empty());
            CHECK(h.runner.builds() == 0U);
            CHECK(h.runner.deploys() == 0U);
            CHECK(h.prober.calls.empty());
            CHECK(h.external_calls() == 0U);
            CHECK_FALSE(detail::contains(h.out.str(), "Deployment Complete!"));
        }
    }

    TEST_CASE("008: confirmed production run reports a healthy endpoint", "[008][pipeline]") {
        harness h{"https://merchant-onboarding-api-e-uc.a.run.app"};
        h.prompt.answers = {"yes"};

        auto profile = resolve_profile(environment_name::production, process_config{});
        console con{h.out, h.err, console_style{}, verbosity::normal};
        deploy_pipeline pipeline{profile, pipeline_options{}, h.io(), con};
        auto result = pipeline.run();

        CHECK(result.code == exit_code::success);
        CHECK_FALSE(result.error);
        REQUIRE(result.outcome);
        CHECK(result.outcome->health == health_status::healthy);
        CHECK(result.outcome->service_endpoint == "https://merchant-onboarding-api-e-uc.a.run.app");
        CHECK(result.outcome->profile.environment == environment_name::production);
        CHECK(h.runner.builds() == 1U);
        CHECK(h.runner.deploys() == 1U);
    }

    TEST_CASE("008: build failure stops before deploy and verify", "[008][pipeline]") {
        harness h{};
        h.runner.on({"builds", "submit"}, {.exit_code = 1});

        auto code = cli::execute(detail::config_for(environment_name::staging), process_config{}, h.context());

        CHECK(code == 1);
        CHECK(h.runner.builds() == 1U);
        CHECK(h.runner.deploys() == 0U);
        CHECK(h.runner.describes() == 0U);
        CHECK(h.prober.calls.empty());
        CHECK(detail::contains(h.err.str(), "Error: build failed (exit 1)"));
        CHECK_FALSE(detail::contains(h.out.str(), "Deployment Complete!"));
    }

    TEST_CASE("008: deploy failure after confirmation never renders the summary", "[008][pipeline]") {
        harness h{};
        h.prompt.answers = {"yes"};
        h.runner.on({"run", "deploy"}, {.exit_code = 1});

        auto profile = resolve_profile(environment_name::production, process_config{});
        console con{h.out, h.err, console_style{}, verbosity::normal};
        deploy_pipeline pipeline{profile, pipeline_options{}, h.io(), con};
        auto result = pipeline.run();

        CHECK(result.code != exit_code::success);
        CHECK(result.error == error_kind::external_stage);
        CHECK_FALSE(result.outcome);
        CHECK(h.runner.builds() == 1U);
        CHECK(h.runner.describes() == 0U);
        CHECK(h.prober.calls.empty());
        CHECK_FALSE(detail::contains(h.out.str(), "Deployment Complete!"));
    }

    TEST_CASE("008: describe failure or missing url is fatal", "[008][pipeline]") {
        SECTION("describe exits non-zero") {
            harness h{};
            h.runner.rules.clear();
            h.runner.on({"auth", "list"}, {.exit_code = 0, .stdout_output = std::string{active_auth_json}});
            h.runner.on({"run", "services", "describe"}, {.exit_code = 1, .stderr_output = "ERROR: not found\n"});

            auto code = cli::execute(detail::config_for(environment_name::staging), process_config{}, h.context());

            CHECK(code == 1);
            CHECK(h.prober.calls.empty());
            CHECK(detail::contains(h.err.str(), "ERROR: not found"));
        }

        SECTION("describe payload without url") {
            harness h{};
            h.runner.rules.clear();
            h.runner.on({"auth", "list"}, {.exit_code = 0, .stdout_output = std::string{active_auth_json}});
            h.runner.on({"run", "services", "describe"}, {.exit_code = 0, .stdout_output = R"({"status":{}})"});

            auto code = cli::execute(detail::config_for(environment_name::staging), process_config{}, h.context());

            CHECK(code == 1);
            CHECK(h.prober.calls.empty());
        }
    }

    TEST_CASE("008: failed verification is advisory only", "[008][pipeline]") {
        harness h{};
        h.prober.reachable.clear();

        auto profile = resolve_profile(environment_name::staging, process_config{});
        console con{h.out, h.err, console_style{}, verbosity::normal};
        deploy_pipeline pipeline{profile, pipeline_options{}, h.io(), con};
        auto result = pipeline.run();

        CHECK(result.code == exit_code::success);
        REQUIRE(result.outcome);
        CHECK(result.outcome->health == health_status::unknown);
        CHECK(result.outcome->probe_attempts == probe_policy{}.max_attempts);
        CHECK(detail::contains(h.out.str(), "Deployment Complete!"));
        CHECK(detail::contains(h.out.str(), "Warning: Health check failed"));
    }

    TEST_CASE("008: precondition failures exit before any build", "[008][pipeline]") {
        SECTION("tool missing") {
            harness h{};
            h.runner.tool_present = false;

            auto code = cli::execute(detail::config_for(environment_name::staging), process_config{}, h.context());

            CHECK(code == 3);
            CHECK(h.runner.commands.empty());
            CHECK(detail::contains(h.err.str(), "Visit: https://cloud.google.com/sdk/docs/install"));
        }

        SECTION("no credential after login") {
            harness h{};
            h.runner.rules.clear();
            h.runner.on({"auth", "list"}, {.exit_code = 0, .stdout_output = "[]"});

            auto code = cli::execute(detail::config_for(environment_name::staging), process_config{}, h.context());

            CHECK(code == 3);
            CHECK(h.runner.count({"auth", "login"}) == 1U);
            CHECK(h.runner.builds() == 0U);
        }
    }

}  // namespace runway::test
