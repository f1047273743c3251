#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "console.hpp"
#include "profile.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace runway {

    enum class error_kind : uint8_t {
        usage,
        precondition,
        user_declined,
        external_stage,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::usage:
                return "usage"sv;
            case error_kind::precondition:
                return "precondition"sv;
            case error_kind::user_declined:
                return "user_declined"sv;
            case error_kind::external_stage:
                return "external_stage"sv;
        }
        return "external_stage"sv;
    }

    // A declined confirmation is a normal termination, not an error
    inline constexpr exit_code to_exit_code(error_kind kind) {
        switch (kind) {
            case error_kind::usage:
                return exit_code::usage;
            case error_kind::precondition:
                return exit_code::precondition;
            case error_kind::user_declined:
                return exit_code::success;
            case error_kind::external_stage:
                return exit_code::failure;
        }
        return exit_code::failure;
    }

    struct stage_result {
        bool success{true};
        error_kind kind{error_kind::external_stage};
        std::string message{};
        std::optional<std::string> remediation{};

        static stage_result ok() { return {}; }

        static stage_result failure(
                error_kind kind, std::string message, std::optional<std::string> remediation = std::nullopt) {
            return {.success = false,
                    .kind = kind,
                    .message = std::move(message),
                    .remediation = std::move(remediation)};
        }
    };

    enum class health_status : uint8_t {
        healthy,
        responding_but_unhealthy,
        unknown,
    };

    inline constexpr std::string_view to_string(health_status status) {
        switch (status) {
            case health_status::healthy:
                return "healthy"sv;
            case health_status::responding_but_unhealthy:
                return "responding"sv;
            case health_status::unknown:
                return "unknown"sv;
        }
        return "unknown"sv;
    }

    struct deployment_outcome {
        std::string service_endpoint{};
        health_status health{health_status::unknown};
        deployment_profile profile{};
        uint32_t probe_attempts{};
    };

    // ── confirmation ────────────────────────────────────────────────

    enum class gate_result : uint8_t { proceed, declined };

    // Affirmative only for the literal token "yes" in any letter case; no trimming
    bool is_affirmative(std::string_view answer);

    class confirmation_gate {
      public:
        confirmation_gate(prompter& prompt, console& con);

        gate_result run(const deployment_profile& profile);

      private:
        prompter& prompt_;
        console& console_;
    };

    // ── preflight ───────────────────────────────────────────────────

    inline constexpr std::string_view install_remediation = "Visit: https://cloud.google.com/sdk/docs/install"sv;

    class preflight_checker {
      public:
        preflight_checker(command_runner& runner, console& con, std::filesystem::path tool);

        stage_result run(const deployment_profile& profile);

        // set once run() has located the tool; later stages invoke this path
        const std::filesystem::path& resolved_tool() const { return resolved_tool_; }

      private:
        bool has_active_credential();

        command_runner& runner_;
        console& console_;
        std::filesystem::path tool_;
        std::filesystem::path resolved_tool_{};
    };

    // ── build / deploy ──────────────────────────────────────────────

    class build_stage {
      public:
        build_stage(command_runner& runner, console& con, std::filesystem::path tool, std::filesystem::path source_dir);

        stage_result run(const deployment_profile& profile);

      private:
        command_runner& runner_;
        console& console_;
        std::filesystem::path tool_;
        std::filesystem::path source_dir_;
    };

    struct deploy_result {
        stage_result status{};
        std::string service_endpoint{};
    };

    class deploy_stage {
      public:
        deploy_stage(command_runner& runner, console& con, std::filesystem::path tool);

        deploy_result run(const deployment_profile& profile);

      private:
        command_runner& runner_;
        console& console_;
        std::filesystem::path tool_;
    };

    // ── verify ──────────────────────────────────────────────────────

    struct probe_policy {
        std::chrono::milliseconds initial_delay{2'000};
        std::chrono::milliseconds base_backoff{1'000};
        std::chrono::milliseconds max_backoff{8'000};
        uint32_t max_attempts{5U};
    };

    // Delay after the failed attempt with the given zero-based index: base * 2^attempt, capped
    std::chrono::milliseconds backoff_delay(const probe_policy& policy, uint32_t attempt);

    inline constexpr std::string_view health_path = "/health"sv;
    inline constexpr std::string_view root_path = "/"sv;

    struct verify_result {
        health_status health{health_status::unknown};
        uint32_t attempts{};
    };

    class verify_stage {
      public:
        verify_stage(http_prober& prober, sleeper& sleep, console& con, probe_policy policy = {});

        // never fails the pipeline; an unreachable service is reported as health_status::unknown
        verify_result run(std::string_view endpoint);

      private:
        http_prober& prober_;
        sleeper& sleep_;
        console& console_;
        probe_policy policy_;
    };

}  // namespace runway
