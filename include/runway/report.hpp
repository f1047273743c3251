#pragma once

#include "console.hpp"
#include "format.hpp"
#include "profile.hpp"
#include "stages.hpp"

#include <array>
#include <ostream>
#include <string_view>

namespace runway::report {

    // Secret-bearing variables provisioned outside runway; listed for the operator, never read
    inline constexpr std::array<std::string_view, 6> managed_secrets{
            "GCS_CLIENT_EMAIL"sv,
            "GCS_PRIVATE_KEY"sv,
            "GCS_BUCKET_NAME"sv,
            "VERTEX_CLIENT_EMAIL (optional)"sv,
            "VERTEX_PRIVATE_KEY (optional)"sv,
            "DB_DSN (if using database features)"sv};

    // progress output; suppressed entirely in quiet mode
    void render_banner(console& con, environment_name env);
    void render_preview(std::ostream& os, const deployment_profile& profile, const console_style& style);
    // the probe attempt count is only listed at verbosity::verbose
    void render_summary(
            std::ostream& os,
            const deployment_outcome& outcome,
            const console_style& style,
            verbosity level = verbosity::normal);

}  // namespace runway::report
