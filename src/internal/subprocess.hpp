#pragma once

#include "runway/collaborators.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace runway::internal {

    // Searches a ':'-separated PATH value (empty means /usr/bin:/bin); names containing '/' are checked as given
    std::optional<std::filesystem::path> find_executable(const std::filesystem::path& tool, std::string_view path_env);

    class system_runner final : public command_runner {
      public:
        std::optional<std::filesystem::path> find_tool(const std::filesystem::path& tool) override;
        command_result run(const command& cmd, io_mode mode) override;
    };

}  // namespace runway::internal
