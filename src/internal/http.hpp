#pragma once

#include "runway/collaborators.hpp"

#include <chrono>
#include <string>

namespace runway::internal {

    // curl_global_init/cleanup for the lifetime of main()
    class curl_global_guard {
      public:
        curl_global_guard();
        ~curl_global_guard();

        curl_global_guard(const curl_global_guard&) = delete;
        curl_global_guard& operator=(const curl_global_guard&) = delete;
    };

    // GET probe; any transport error or HTTP status >= 400 counts as failure, redirects are not followed
    class curl_prober final : public http_prober {
      public:
        explicit curl_prober(std::chrono::seconds timeout = std::chrono::seconds{10});

        bool probe(const std::string& url) override;

      private:
        std::chrono::seconds timeout_;
    };

    class thread_sleeper final : public sleeper {
      public:
        void sleep_for(std::chrono::milliseconds delay) override;
    };

}  // namespace runway::internal
