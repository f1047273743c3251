#pragma once

#include "config.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace runway {

    struct resource_limits {
        std::string memory_limit{};
        uint32_t cpu_count{};
    };

    struct scaling_bounds {
        uint32_t min_instances{};
        uint32_t max_instances{};
    };

    /*
     * Fully resolved deployment parameters for one run. Only resolve_profile() builds these;
     * debug_enabled is derived from log_verbosity and never supplied independently.
     */
    struct deployment_profile {
        environment_name environment{environment_name::staging};
        std::string service_name{};
        resource_limits resources{};
        scaling_bounds scaling{};
        uint32_t request_timeout_seconds{};
        log_level log_verbosity{log_level::info};
        bool debug_enabled{false};
        bool requires_confirmation{false};
        std::string project_id{};
        std::string region{};
        std::string image_reference{};

        std::string tagged_image() const { return image_reference + ":latest"; }
    };

    inline constexpr std::string_view service_base_name = "merchant-onboarding-api"sv;
    inline constexpr std::string_view image_registry = "gcr.io"sv;
    inline constexpr uint16_t service_port = 8080U;

    std::string make_image_reference(std::string_view project_id, std::string_view service_name);

    deployment_profile resolve_profile(environment_name env, const process_config& process);

}  // namespace runway
