#pragma once

#include <string_view>

namespace runway::internal::platform {

    inline constexpr auto version = std::string_view{RUNWAY_VERSION};

}  // namespace runway::internal::platform
