#pragma once

#include "collaborators.hpp"
#include "format.hpp"

#include <cstdint>
#include <ostream>
#include <string_view>

namespace runway {

    enum class verbosity : uint8_t { quiet, normal, verbose };

    inline constexpr verbosity make_verbosity(bool quiet, bool verbose) {
        if (quiet) {
            return verbosity::quiet;
        }
        return verbose ? verbosity::verbose : verbosity::normal;
    }

    /*
     * Operator-facing status output. Progress lines (heading/info) are dropped in quiet mode,
     * command echo only appears in verbose mode; warnings, errors and report text always print.
     * Errors go to the error stream, everything else to the output stream.
     */
    class console {
      public:
        console(std::ostream& out, std::ostream& err, console_style style, verbosity level);

        void heading(std::string_view text);
        void info(std::string_view text);
        void success(std::string_view text);
        void warning(std::string_view text);
        void error(std::string_view text);
        void error_detail(std::string_view text);
        void line(std::string_view text = {});
        void echo_command(const command& cmd);
        void flush();

        std::ostream& out() { return out_; }
        const console_style& style() const { return style_; }
        verbosity level() const { return level_; }

      private:
        std::ostream& out_;
        std::ostream& err_;
        console_style style_;
        verbosity level_;
    };

}  // namespace runway
