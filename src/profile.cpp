#include "runway/profile.hpp"

#include "runway/format.hpp"

using namespace runway::literals;

namespace runway {

    namespace detail {

        struct profile_template {
            std::string_view service_suffix{};
            std::string_view memory_limit{};
            uint32_t cpu_count{};
            scaling_bounds scaling{};
            uint32_t request_timeout_seconds{};
            log_level log_verbosity{log_level::info};
            bool requires_confirmation{false};
        };

        // staging: cheap and fast to iterate on; scales to zero
        static constexpr profile_template staging_template{
                .service_suffix = "-staging"sv,
                .memory_limit = "1Gi"sv,
                .cpu_count = 1U,
                .scaling = {.min_instances = 0U, .max_instances = 5U},
                .request_timeout_seconds = 300U,
                .log_verbosity = log_level::info,
                .requires_confirmation = false};

        // production: keeps one warm instance and allows long-running requests
        static constexpr profile_template production_template{
                .service_suffix = ""sv,
                .memory_limit = "2Gi"sv,
                .cpu_count = 2U,
                .scaling = {.min_instances = 1U, .max_instances = 10U},
                .request_timeout_seconds = 3600U,
                .log_verbosity = log_level::warning,
                .requires_confirmation = true};

        static_assert(staging_template.scaling.min_instances <= staging_template.scaling.max_instances);
        static_assert(production_template.scaling.min_instances <= production_template.scaling.max_instances);

        static constexpr const profile_template& template_for(environment_name env) {
            switch (env) {
                case environment_name::staging:
                    return staging_template;
                case environment_name::production:
                    return production_template;
            }
            return staging_template;
        }

    }  // namespace detail

    std::string make_image_reference(std::string_view project_id, std::string_view service_name) {
        return "{}/{}/{}"_format(image_registry, project_id, service_name);
    }

    deployment_profile resolve_profile(environment_name env, const process_config& process) {
        const auto& tmpl = detail::template_for(env);

        deployment_profile profile{};
        profile.environment = env;
        profile.service_name = "{}{}"_format(service_base_name, tmpl.service_suffix);
        profile.resources = resource_limits{.memory_limit = std::string{tmpl.memory_limit}, .cpu_count = tmpl.cpu_count};
        profile.scaling = tmpl.scaling;
        profile.request_timeout_seconds = tmpl.request_timeout_seconds;
        profile.log_verbosity = tmpl.log_verbosity;
        profile.debug_enabled = tmpl.log_verbosity == most_verbose_log_level;
        profile.requires_confirmation = tmpl.requires_confirmation;
        profile.project_id = process.project_id;
        profile.region = process.region;
        profile.image_reference = make_image_reference(profile.project_id, profile.service_name);

        debug_log("resolved profile ", profile.service_name, " for ", to_string(env));
        return profile;
    }

}  // namespace runway
