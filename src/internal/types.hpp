#pragma once

#include <glaze/glaze.hpp>

#include <string>
#include <vector>

namespace runway::internal {

    // `gcloud auth list --format json` entry
    struct auth_account {
        std::string account{};
        std::string status{};
        struct glaze {
            using T = auth_account;
            static constexpr auto value = glz::object(&T::account, &T::status);
        };
    };

    struct service_status {
        std::string url{};
        struct glaze {
            using T = service_status;
            static constexpr auto value = glz::object(&T::url);
        };
    };

    // `gcloud run services describe --format json`; only the fields runway reads
    struct service_description {
        service_status status{};
        struct glaze {
            using T = service_description;
            static constexpr auto value = glz::object(&T::status);
        };
    };

}  // namespace runway::internal
