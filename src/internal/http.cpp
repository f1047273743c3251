#include "http.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <thread>

namespace runway::internal {

    namespace detail {

        struct easy_handle_deleter {
            void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
        };

        using easy_handle = std::unique_ptr<CURL, easy_handle_deleter>;

        static size_t discard_body(char*, size_t size, size_t nmemb, void*) {
            return size * nmemb;
        }

    }  // namespace detail

    curl_global_guard::curl_global_guard() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    curl_global_guard::~curl_global_guard() {
        curl_global_cleanup();
    }

    curl_prober::curl_prober(std::chrono::seconds timeout) : timeout_{timeout} {}

    bool curl_prober::probe(const std::string& url) {
        detail::easy_handle handle{curl_easy_init()};
        if (!handle) {
            throw std::runtime_error("curl_easy_init failed");
        }

        curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, detail::discard_body);

        auto res = curl_easy_perform(handle.get());
        if (res != CURLE_OK) {
            debug_log("probe ", url, " failed: ", curl_easy_strerror(res));
            return false;
        }
        return true;
    }

    void thread_sleeper::sleep_for(std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    }

}  // namespace runway::internal
