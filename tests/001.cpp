#include "utils.hpp"

namespace runway::test {
    using namespace std::string_view_literals;

    namespace detail {
        static const char* no_overrides(const char*) {
            return nullptr;
        }

        static const char* full_overrides(const char* name) {
            auto key = std::string_view{name};
            if (key == "GCP_PROJECT_ID"sv) {
                return "acme-prod-42";
            }
            if (key == "GCP_REGION"sv) {
                return "europe-west1";
            }
            if (key == "NO_COLOR"sv) {
                return "1";
            }
            return nullptr;
        }

        static const char* empty_overrides(const char*) {
            return "";
        }
    }  // namespace detail

    TEST_CASE("001: environment parsing accepts only the two named environments", "[001][config]") {
        environment_name env = environment_name::production;

        REQUIRE(try_parse_environment("staging"sv, env));
        CHECK(env == environment_name::staging);
        REQUIRE(try_parse_environment("production"sv, env));
        CHECK(env == environment_name::production);

        CHECK_FALSE(try_parse_environment(""sv, env));
        CHECK_FALSE(try_parse_environment("prod"sv, env));
        CHECK_FALSE(try_parse_environment("Staging"sv, env));
        CHECK_FALSE(try_parse_environment("dev"sv, env));
        CHECK_FALSE(try_parse_environment("staging "sv, env));
        CHECK(env == environment_name::production);
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(environment_name::staging) == "staging"sv);
        CHECK(to_string(environment_name::production) == "production"sv);

        CHECK(to_string(log_level::info) == "INFO"sv);
        CHECK(to_string(log_level::warning) == "WARNING"sv);
        CHECK(to_string(log_level::error) == "ERROR"sv);

        CHECK(to_string(color_mode::automatic) == "auto"sv);
        CHECK(to_string(color_mode::always) == "always"sv);
        CHECK(to_string(color_mode::never) == "never"sv);

        CHECK(to_int(exit_code::success) == 0);
        CHECK(to_int(exit_code::failure) == 1);
        CHECK(to_int(exit_code::usage) == 2);
        CHECK(to_int(exit_code::precondition) == 3);
    }

    TEST_CASE("001: color mode parsing and resolution", "[001][config]") {
        color_mode mode = color_mode::automatic;

        REQUIRE(try_parse_color_mode("ALWAYS"sv, mode));
        CHECK(mode == color_mode::always);
        REQUIRE(try_parse_color_mode("never"sv, mode));
        CHECK(mode == color_mode::never);
        REQUIRE(try_parse_color_mode("Auto"sv, mode));
        CHECK(mode == color_mode::automatic);
        CHECK_FALSE(try_parse_color_mode("sometimes"sv, mode));

        CHECK(resolve_color(color_mode::automatic, true, false));
        CHECK_FALSE(resolve_color(color_mode::automatic, false, false));
        CHECK_FALSE(resolve_color(color_mode::automatic, true, true));
        CHECK(resolve_color(color_mode::always, false, true));
        CHECK_FALSE(resolve_color(color_mode::never, true, false));
    }

    TEST_CASE("001: process configuration falls back to documented defaults", "[001][config]") {
        SECTION("no overrides") {
            auto cfg = process_config::from_environment(&detail::no_overrides);
            CHECK(cfg.project_id == "shopify-473015");
            CHECK(cfg.region == "us-central1");
            CHECK_FALSE(cfg.no_color);
        }

        SECTION("both overrides") {
            auto cfg = process_config::from_environment(&detail::full_overrides);
            CHECK(cfg.project_id == "acme-prod-42");
            CHECK(cfg.region == "europe-west1");
            CHECK(cfg.no_color);
            CHECK_FALSE(resolve_color(color_mode::automatic, true, cfg.no_color));
        }

        SECTION("empty values count as unset") {
            auto cfg = process_config::from_environment(&detail::empty_overrides);
            CHECK(cfg.project_id == defaults::project_id);
            CHECK(cfg.region == defaults::region);
            CHECK_FALSE(cfg.no_color);
        }
    }

    TEST_CASE("001: console style paints only when color is enabled", "[001][format]") {
        console_style plain{};
        CHECK(plain.paint(tone::error, "boom"sv) == "boom");

        console_style colored{.color = true};
        CHECK(colored.paint(tone::error, "boom"sv) == "\x1b[0;31mboom\x1b[0m");
        CHECK(colored.paint(tone::success, "ok"sv) == "\x1b[0;32mok\x1b[0m");
        CHECK(colored.paint(tone::plain, "text"sv) == "text");
    }
}  // namespace runway::test
