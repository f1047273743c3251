#include "runway/stages.hpp"

namespace runway {

    bool is_affirmative(std::string_view answer) {
        return utils::str_case_eq(answer, "yes"sv);
    }

    confirmation_gate::confirmation_gate(prompter& prompt, console& con) : prompt_{prompt}, console_{con} {}

    gate_result confirmation_gate::run(const deployment_profile& profile) {
        if (!profile.requires_confirmation) {
            return gate_result::proceed;
        }

        console_.error("WARNING: You are about to deploy to PRODUCTION!");
        console_.line();
        console_.flush();

        auto answer = prompt_.prompt("Type 'yes' to confirm production deployment: ");
        console_.line();
        if (!answer || !is_affirmative(*answer)) {
            debug_log("confirmation declined");
            console_.warning("Deployment cancelled.");
            return gate_result::declined;
        }
        return gate_result::proceed;
    }

}  // namespace runway
