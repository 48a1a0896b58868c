#include "prompt_augmenter.hpp"
#include "protocol.hpp"

namespace relay::gemini {

GenerationRequest augment_request(const GenerationRequest& request) {
    GenerationRequest augmented = request;

    if (!augmented.system_instruction) {
        Content instruction;
        instruction.role = "user";
        instruction.parts.push_back(Part::from_text(COMPLETION_MANDATE));
        augmented.system_instruction = instruction;
        return augmented;
    }

    auto& parts = augmented.system_instruction->parts;
    if (!parts.empty() && parts.back().text) {
        std::string& text = *parts.back().text;
        text = text.empty() ? std::string(COMPLETION_MANDATE)
                            : text + "\n\n" + COMPLETION_MANDATE;
    } else {
        parts.push_back(Part::from_text(COMPLETION_MANDATE));
    }
    return augmented;
}

} // namespace relay::gemini
