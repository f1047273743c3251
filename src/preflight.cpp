#include "runway/stages.hpp"

#include "runway/format.hpp"

#include "internal/gcloud.hpp"

using namespace runway::literals;

namespace runway {

    preflight_checker::preflight_checker(command_runner& runner, console& con, std::filesystem::path tool)
            : runner_{runner}, console_{con}, tool_{std::move(tool)} {}

    bool preflight_checker::has_active_credential() {
        auto cmd = internal::gcloud::auth_list(resolved_tool_);
        console_.echo_command(cmd);
        auto result = runner_.run(cmd, io_mode::captured);
        if (!result.ok()) {
            debug_log("auth list exited with ", result.exit_code);
            return false;
        }
        return internal::gcloud::has_active_account(result.stdout_output);
    }

    stage_result preflight_checker::run(const deployment_profile& profile) {
        auto found = runner_.find_tool(tool_);
        if (!found) {
            return stage_result::failure(
                    error_kind::precondition,
                    "Error: {} CLI is not installed."_format(tool_.filename().string()),
                    std::string{install_remediation});
        }
        resolved_tool_ = *found;
        debug_log("using tool at ", resolved_tool_.string());

        if (!has_active_credential()) {
            console_.warning("Not authenticated. Running {} auth login..."_format(tool_.filename().string()));
            console_.flush();

            auto login = internal::gcloud::auth_login(resolved_tool_);
            console_.echo_command(login);
            auto login_result = runner_.run(login, io_mode::inherited);
            if (!login_result.ok()) {
                return stage_result::failure(
                        error_kind::precondition,
                        "Error: authentication failed (exit {})"_format(login_result.exit_code),
                        "Run '{} auth login' manually and retry."_format(tool_.filename().string()));
            }
            if (!has_active_credential()) {
                return stage_result::failure(
                        error_kind::precondition,
                        "Error: no active credential after login",
                        "Run '{} auth list' to inspect credentialed accounts."_format(tool_.filename().string()));
            }
        }

        console_.info("Setting project to: {}"_format(profile.project_id));
        console_.flush();
        auto select = internal::gcloud::set_project(resolved_tool_, profile);
        console_.echo_command(select);
        auto select_result = runner_.run(select, io_mode::inherited);
        if (!select_result.ok()) {
            return stage_result::failure(
                    error_kind::external_stage,
                    "Error: failed to set project {} (exit {})"_format(profile.project_id, select_result.exit_code));
        }

        return stage_result::ok();
    }

}  // namespace runway
