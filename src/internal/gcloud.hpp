#pragma once

#include "runway/collaborators.hpp"
#include "runway/profile.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace runway::internal::gcloud {

    namespace fs = std::filesystem;

    command auth_list(const fs::path& tool);
    command auth_login(const fs::path& tool);
    command set_project(const fs::path& tool, const deployment_profile& profile);
    command builds_submit(const fs::path& tool, const deployment_profile& profile, const fs::path& source_dir);
    command run_deploy(const fs::path& tool, const deployment_profile& profile);
    command describe_service(const fs::path& tool, const deployment_profile& profile);

    // ENVIRONMENT=<env>,DEBUG=<true|false>,LOG_LEVEL=<level>
    std::string env_vars_assignment(const deployment_profile& profile);

    bool has_active_account(std::string_view auth_list_json);

    // status.url of a service description; std::nullopt if the payload is malformed or has no url
    std::optional<std::string> parse_service_url(std::string_view describe_json);

}  // namespace runway::internal::gcloud
