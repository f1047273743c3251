#include "runway/console.hpp"

namespace runway {

    console::console(std::ostream& out, std::ostream& err, console_style style, verbosity level)
            : out_{out}, err_{err}, style_{style}, level_{level} {}

    void console::heading(std::string_view text) {
        if (level_ == verbosity::quiet) {
            return;
        }
        out_ << style_.paint(tone::heading, text) << '\n';
    }

    void console::info(std::string_view text) {
        if (level_ == verbosity::quiet) {
            return;
        }
        out_ << style_.paint(tone::info, text) << '\n';
    }

    void console::success(std::string_view text) {
        out_ << style_.paint(tone::success, text) << '\n';
    }

    void console::warning(std::string_view text) {
        out_ << style_.paint(tone::warning, text) << '\n';
    }

    void console::error(std::string_view text) {
        err_ << style_.paint(tone::error, text) << '\n';
    }

    void console::error_detail(std::string_view text) {
        err_ << text << '\n';
    }

    void console::line(std::string_view text) {
        out_ << text << '\n';
    }

    void console::echo_command(const command& cmd) {
        if (level_ != verbosity::verbose) {
            return;
        }
        out_ << "+ " << cmd.to_string() << '\n';
    }

    void console::flush() {
        out_.flush();
        err_.flush();
    }

}  // namespace runway
