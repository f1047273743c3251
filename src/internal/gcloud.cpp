#include "gcloud.hpp"

#include "types.hpp"

#include "runway/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <initializer_list>
#include <vector>

using namespace runway::literals;

namespace runway::internal::gcloud {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr auto active_status = "ACTIVE"sv;
        static constexpr auto managed_platform = "managed"sv;

        static command make(const fs::path& tool, std::initializer_list<std::string> args) {
            command cmd{};
            cmd.args.reserve(args.size() + 1U);
            cmd.args.push_back(tool.string());
            cmd.args.insert(cmd.args.end(), args.begin(), args.end());
            return cmd;
        }

    }  // namespace detail

    command auth_list(const fs::path& tool) {
        return detail::make(tool, {"auth", "list", "--filter=status:ACTIVE", "--format=json"});
    }

    command auth_login(const fs::path& tool) {
        return detail::make(tool, {"auth", "login"});
    }

    command set_project(const fs::path& tool, const deployment_profile& profile) {
        return detail::make(tool, {"config", "set", "project", profile.project_id});
    }

    command builds_submit(const fs::path& tool, const deployment_profile& profile, const fs::path& source_dir) {
        return detail::make(
                tool,
                {"builds",
                 "submit",
                 "--tag",
                 profile.tagged_image(),
                 "--project",
                 profile.project_id,
                 source_dir.string()});
    }

    command run_deploy(const fs::path& tool, const deployment_profile& profile) {
        return detail::make(
                tool,
                {"run",
                 "deploy",
                 profile.service_name,
                 "--image",
                 profile.tagged_image(),
                 "--platform",
                 std::string{detail::managed_platform},
                 "--region",
                 profile.region,
                 "--project",
                 profile.project_id,
                 "--allow-unauthenticated",
                 "--port",
                 std::to_string(service_port),
                 "--memory",
                 profile.resources.memory_limit,
                 "--cpu",
                 std::to_string(profile.resources.cpu_count),
                 "--timeout",
                 std::to_string(profile.request_timeout_seconds),
                 "--min-instances",
                 std::to_string(profile.scaling.min_instances),
                 "--max-instances",
                 std::to_string(profile.scaling.max_instances),
                 "--set-env-vars={}"_format(env_vars_assignment(profile))});
    }

    command describe_service(const fs::path& tool, const deployment_profile& profile) {
        return detail::make(
                tool,
                {"run",
                 "services",
                 "describe",
                 profile.service_name,
                 "--platform",
                 std::string{detail::managed_platform},
                 "--region",
                 profile.region,
                 "--format=json",
                 "--project",
                 profile.project_id});
    }

    std::string env_vars_assignment(const deployment_profile& profile) {
        return "ENVIRONMENT={},DEBUG={},LOG_LEVEL={}"_format(
                to_string(profile.environment),
                profile.debug_enabled ? "true"sv : "false"sv,
                to_string(profile.log_verbosity));
    }

    bool has_active_account(std::string_view auth_list_json) {
        std::vector<auth_account> accounts{};
        std::string buffer{auth_list_json};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(accounts, buffer);
        if (ec) {
            debug_log("unparseable auth list payload");
            return false;
        }
        return std::ranges::any_of(
                accounts, [](const auth_account& a) { return !a.account.empty() && a.status == detail::active_status; });
    }

    std::optional<std::string> parse_service_url(std::string_view describe_json) {
        service_description description{};
        std::string buffer{describe_json};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(description, buffer);
        if (ec) {
            debug_log("unparseable service description payload");
            return std::nullopt;
        }
        if (description.status.url.empty()) {
            return std::nullopt;
        }
        return description.status.url;
    }

}  // namespace runway::internal::gcloud
