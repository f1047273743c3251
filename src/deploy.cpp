#include "runway/stages.hpp"

#include "runway/format.hpp"

#include "internal/gcloud.hpp"

using namespace runway::literals;

namespace runway {

    build_stage::build_stage(
            command_runner& runner, console& con, std::filesystem::path tool, std::filesystem::path source_dir)
            : runner_{runner}, console_{con}, tool_{std::move(tool)}, source_dir_{std::move(source_dir)} {}

    stage_result build_stage::run(const deployment_profile& profile) {
        console_.info("Building and pushing Docker image...");
        console_.flush();

        auto cmd = internal::gcloud::builds_submit(tool_, profile, source_dir_);
        console_.echo_command(cmd);
        auto result = runner_.run(cmd, io_mode::inherited);
        if (!result.ok()) {
            return stage_result::failure(
                    error_kind::external_stage, "Error: build failed (exit {})"_format(result.exit_code));
        }
        return stage_result::ok();
    }

    deploy_stage::deploy_stage(command_runner& runner, console& con, std::filesystem::path tool)
            : runner_{runner}, console_{con}, tool_{std::move(tool)} {}

    deploy_result deploy_stage::run(const deployment_profile& profile) {
        console_.info("Deploying to Cloud Run...");
        console_.flush();

        auto deploy = internal::gcloud::run_deploy(tool_, profile);
        console_.echo_command(deploy);
        auto deploy_status = runner_.run(deploy, io_mode::inherited);
        if (!deploy_status.ok()) {
            return {.status = stage_result::failure(
                            error_kind::external_stage, "Error: deploy failed (exit {})"_format(deploy_status.exit_code))};
        }

        // the endpoint counts only once the control plane describes the service independently
        auto describe = internal::gcloud::describe_service(tool_, profile);
        console_.echo_command(describe);
        auto description = runner_.run(describe, io_mode::captured);
        if (!description.ok()) {
            if (!description.stderr_output.empty()) {
                console_.error_detail(utils::trim_view(description.stderr_output));
            }
            return {.status = stage_result::failure(
                            error_kind::external_stage,
                            "Error: failed to describe service {} (exit {})"_format(
                                    profile.service_name, description.exit_code))};
        }

        auto url = internal::gcloud::parse_service_url(description.stdout_output);
        if (!url) {
            return {.status = stage_result::failure(
                            error_kind::external_stage,
                            "Error: service {} has no routable url"_format(profile.service_name))};
        }

        debug_log("service endpoint: ", *url);
        return {.status = stage_result::ok(), .service_endpoint = std::move(*url)};
    }

}  // namespace runway
