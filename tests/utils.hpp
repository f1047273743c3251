#pragma once

#include "runway/cli.hpp"
#include "runway/config.hpp"
#include "runway/console.hpp"
#include "runway/pipeline.hpp"
#include "runway/profile.hpp"
#include "runway/report.hpp"
#include "runway/stages.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <sys/stat.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace runway::test {
    namespace fs = std::filesystem;
}  // namespace runway::test

namespace runway::test::detail {

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

}  // namespace runway::test::detail
