#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "engine/collaborators.hpp"

namespace vita {

// Template narratives per debt type. An optional draft source (for example
// an on-device language model) is consulted first; its text is used only
// when non-empty and grounded in the chain or the symptom.
class TemplateNarrativeGenerator : public NarrativeGenerator
{
public:
    using DraftSource = std::function<std::optional<std::string>(const std::string &prompt)>;

    TemplateNarrativeGenerator() = default;
    explicit TemplateNarrativeGenerator(DraftSource draftSource);

    std::future<std::string> generate(const std::string &symptom,
                                      const Hypothesis &hypothesis,
                                      const std::vector<ToolObservation> &observations) const override;

    static std::string templateNarrative(const std::string &symptom,
                                         const Hypothesis &hypothesis,
                                         const std::vector<ToolObservation> &observations);

    // True when the text mentions a chain or symptom word longer than three
    // characters.
    static bool isGrounded(const std::string &text,
                           const std::string &symptom,
                           const std::vector<std::string> &causalChain);

    static std::string buildPrompt(const std::string &symptom,
                                   const Hypothesis &hypothesis,
                                   const std::vector<ToolObservation> &observations);

private:
    DraftSource m_draftSource;
};

} // namespace vita
