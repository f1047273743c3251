#pragma once

#include "runway/collaborators.hpp"
#include "runway/config.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace runway::internal {

    class line_editor {
      public:
        explicit line_editor(color_mode color);

        std::optional<std::string> read_line(std::string_view prompt);
    };

    /*
     * Confirmation input from the operator. A terminal gets isocline line editing; a piped stdin
     * is read one plain line at a time so scripted answers work.
     */
    class terminal_prompter final : public prompter {
      public:
        terminal_prompter(color_mode color, std::istream& in, std::ostream& out);

        std::optional<std::string> prompt(std::string_view question) override;

      private:
        color_mode color_;
        std::istream& in_;
        std::ostream& out_;
    };

}  // namespace runway::internal
