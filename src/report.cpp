#include "runway/report.hpp"

#include <iomanip>
#include <sstream>

using namespace runway::literals;

namespace runway::report {

    namespace detail {

        static constexpr auto rule = "=============================================="sv;

        static void field(std::ostream& os, std::string_view indent, std::string_view label, std::string_view value) {
            os << indent << std::left << std::setw(16) << label << value << '\n';
        }

        static std::string_view health_line(health_status status) {
            switch (status) {
                case health_status::healthy:
                    return "Health:       passed"sv;
                case health_status::responding_but_unhealthy:
                    return "Health:       responding (health endpoint unavailable)"sv;
                case health_status::unknown:
                    return "Health:       unknown (service may still be starting)"sv;
            }
            return "Health:       unknown"sv;
        }

    }  // namespace detail

    void render_banner(console& con, environment_name env) {
        if (con.level() == verbosity::quiet) {
            return;
        }
        con.heading("=== Agent Builder - Cloud Run Deployment ===");
        con.info("Environment: {}"_format(to_string(env)));
        con.line();
    }

    void render_preview(std::ostream& os, const deployment_profile& profile, const console_style& style) {
        os << '\n';
        os << style.paint(tone::heading, "Deployment Configuration:") << '\n';
        detail::field(os, "   ", "Environment:", to_string(profile.environment));
        detail::field(os, "   ", "Service Name:", profile.service_name);
        detail::field(os, "   ", "Project:", profile.project_id);
        detail::field(os, "   ", "Region:", profile.region);
        detail::field(
                os,
                "   ",
                "Resources:",
                "{} RAM, {} CPU"_format(profile.resources.memory_limit, profile.resources.cpu_count));
        detail::field(
                os,
                "   ",
                "Scaling:",
                "{}-{} instances"_format(profile.scaling.min_instances, profile.scaling.max_instances));
        detail::field(os, "   ", "Log Level:", to_string(profile.log_verbosity));
        os << '\n';
    }

    void render_summary(
            std::ostream& os, const deployment_outcome& outcome, const console_style& style, verbosity level) {
        const auto& profile = outcome.profile;

        std::ostringstream block{};
        block << detail::rule << '\n';
        block << "Deployment Complete!" << '\n';
        block << detail::rule << '\n';
        block << "Environment:  " << to_string(profile.environment) << '\n';
        block << "Service:      " << profile.service_name << '\n';
        block << "URL:          " << outcome.service_endpoint << '\n';
        block << "Project:      " << profile.project_id << '\n';
        block << "Region:       " << profile.region << '\n';
        block << detail::health_line(outcome.health) << '\n';
        block << detail::rule;

        os << '\n';
        os << style.paint(tone::success, block.str()) << '\n';
        if (level == verbosity::verbose) {
            os << "Probe attempts: " << outcome.probe_attempts << '\n';
        }
        os << '\n';
        os << style.paint(tone::info, "Note: Make sure environment variables are set in Cloud Run:") << '\n';
        for (auto secret : managed_secrets) {
            os << "   - " << secret << '\n';
        }
    }

}  // namespace runway::report
