#include "runway/pipeline.hpp"

#include "runway/report.hpp"

namespace runway {

    deploy_pipeline::deploy_pipeline(
            const deployment_profile& profile, pipeline_options options, collaborators io, console& con)
            : profile_{profile}, options_{std::move(options)}, io_{io}, console_{con} {}

    pipeline_result deploy_pipeline::halt(const stage_result& failed) {
        debug_log("halting pipeline: ", to_string(failed.kind));
        console_.error(failed.message);
        if (failed.remediation) {
            console_.error_detail(*failed.remediation);
        }
        return {.code = to_exit_code(failed.kind), .error = failed.kind};
    }

    pipeline_result deploy_pipeline::run() {
        report::render_banner(console_, profile_.environment);
        report::render_preview(console_.out(), profile_, console_.style());

        confirmation_gate gate{io_.prompt, console_};
        if (gate.run(profile_) == gate_result::declined) {
            return {.code = to_exit_code(error_kind::user_declined), .error = error_kind::user_declined};
        }

        preflight_checker preflight{io_.runner, console_, options_.tool};
        if (auto status = preflight.run(profile_); !status.success) {
            return halt(status);
        }

        build_stage build{io_.runner, console_, preflight.resolved_tool(), options_.source_dir};
        if (auto status = build.run(profile_); !status.success) {
            return halt(status);
        }

        deploy_stage deploy{io_.runner, console_, preflight.resolved_tool()};
        auto deployed = deploy.run(profile_);
        if (!deployed.status.success) {
            return halt(deployed.status);
        }

        verify_stage verify{io_.prober, io_.sleep, console_, options_.probe};
        auto verified = verify.run(deployed.service_endpoint);

        const deployment_outcome outcome{
                .service_endpoint = std::move(deployed.service_endpoint),
                .health = verified.health,
                .profile = profile_,
                .probe_attempts = verified.attempts};

        report::render_summary(console_.out(), outcome, console_.style(), console_.level());
        console_.flush();
        return {.code = exit_code::success, .outcome = outcome};
    }

}  // namespace runway
