#pragma once

#include "collaborators.hpp"
#include "console.hpp"
#include "profile.hpp"
#include "stages.hpp"

#include <filesystem>
#include <optional>

namespace runway {

    struct pipeline_options {
        std::filesystem::path tool{"gcloud"};
        std::filesystem::path source_dir{"."};
        probe_policy probe{};
    };

    struct pipeline_result {
        exit_code code{exit_code::success};
        std::optional<error_kind> error{};
        std::optional<deployment_outcome> outcome{};
    };

    /*
     * gate → preflight → build → deploy → verify, halting on the first failed stage.
     * Nothing is retried or rolled back; the summary is rendered only after a complete run.
     */
    class deploy_pipeline {
      public:
        deploy_pipeline(const deployment_profile& profile, pipeline_options options, collaborators io, console& con);

        pipeline_result run();

      private:
        pipeline_result halt(const stage_result& failed);

        const deployment_profile& profile_;
        pipeline_options options_;
        collaborators io_;
        console& console_;
    };

}  // namespace runway
