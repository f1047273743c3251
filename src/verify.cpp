#include "runway/stages.hpp"

#include "runway/format.hpp"

#include <algorithm>

using namespace runway::literals;

namespace runway {

    namespace detail {

        static std::string join_url(std::string_view endpoint, std::string_view path) {
            while (endpoint.ends_with('/')) {
                endpoint.remove_suffix(1U);
            }
            return "{}{}"_format(endpoint, path);
        }

    }  // namespace detail

    std::chrono::milliseconds backoff_delay(const probe_policy& policy, uint32_t attempt) {
        auto delay = policy.base_backoff;
        for (uint32_t i = 0; i < attempt && delay < policy.max_backoff; ++i) {
            delay *= 2;
        }
        return std::min(delay, policy.max_backoff);
    }

    verify_stage::verify_stage(http_prober& prober, sleeper& sleep, console& con, probe_policy policy)
            : prober_{prober}, sleep_{sleep}, console_{con}, policy_{policy} {}

    verify_result verify_stage::run(std::string_view endpoint) {
        console_.info("Testing health endpoint...");
        console_.flush();

        auto health_url = detail::join_url(endpoint, health_path);
        auto root_url = detail::join_url(endpoint, root_path);

        verify_result result{};
        sleep_.sleep_for(policy_.initial_delay);

        for (uint32_t attempt = 0; attempt < policy_.max_attempts; ++attempt) {
            ++result.attempts;

            if (prober_.probe(health_url)) {
                console_.success("Health check passed!");
                result.health = health_status::healthy;
                return result;
            }
            if (prober_.probe(root_url)) {
                console_.success("Service is responding!");
                result.health = health_status::responding_but_unhealthy;
                return result;
            }

            if (attempt + 1U < policy_.max_attempts) {
                auto delay = backoff_delay(policy_, attempt);
                debug_log("probe attempt ", attempt + 1U, " failed, retrying in ", delay.count(), "ms");
                sleep_.sleep_for(delay);
            }
        }

        console_.warning("Warning: Health check failed - service may still be starting");
        result.health = health_status::unknown;
        return result;
    }

}  // namespace runway
