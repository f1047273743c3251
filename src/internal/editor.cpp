#include "editor.hpp"

extern "C" {
#include <isocline.h>
#include <unistd.h>
}

#include <ostream>

namespace runway::internal {

    line_editor::line_editor(color_mode color) {
        ic_enable_multiline(false);
        ic_enable_completion_preview(false);
        ic_enable_hint(false);
        ic_set_prompt_marker("", "");
        // confirmation answers never go to a history file
        ic_set_history(nullptr, 1000);

        switch (color) {
            case color_mode::automatic:
                break;
            case color_mode::always:
                ic_enable_color(true);
                break;
            case color_mode::never:
                ic_enable_color(false);
                break;
        }
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    terminal_prompter::terminal_prompter(color_mode color, std::istream& in, std::ostream& out)
            : color_{color}, in_{in}, out_{out} {}

    std::optional<std::string> terminal_prompter::prompt(std::string_view question) {
        if (::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1) {
            line_editor editor{color_};
            return editor.read_line(question);
        }

        out_ << question << std::flush;
        std::string line{};
        if (!std::getline(in_, line)) {
            return std::nullopt;
        }
        return line;
    }

}  // namespace runway::internal
