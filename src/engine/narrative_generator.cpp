#include "engine/narrative_generator.hpp"

#include <cctype>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/signal_math.hpp"

namespace vita {

namespace {

std::vector<std::string> significantWords(const std::string &text)
{
    std::vector<std::string> words;
    std::string current;
    for (const char c : toLowerAscii(text)) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
            continue;
        }
        if (current.size() > 3) {
            words.push_back(current);
        }
        current.clear();
    }
    if (current.size() > 3) {
        words.push_back(current);
    }
    return words;
}

std::string joinChain(const std::vector<std::string> &chain, const std::string &separator)
{
    std::string joined;
    for (std::size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += chain[i];
    }
    return joined;
}

std::string trimmed(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

TemplateNarrativeGenerator::TemplateNarrativeGenerator(DraftSource draftSource)
    : m_draftSource(std::move(draftSource))
{
}

std::future<std::string> TemplateNarrativeGenerator::generate(
    const std::string &symptom,
    const Hypothesis &hypothesis,
    const std::vector<ToolObservation> &observations) const
{
    if (!m_draftSource) {
        return std::async(std::launch::deferred, [=]() {
            return templateNarrative(symptom, hypothesis, observations);
        });
    }

    const DraftSource draftSource = m_draftSource;
    const QString corr = vita::logging::currentCorrelationId();
    return std::async(std::launch::async, [=]() {
        vita::logging::CorrelationScope scope(corr);
        const auto draft = draftSource(buildPrompt(symptom, hypothesis, observations));
        if (draft) {
            const std::string text = trimmed(*draft);
            if (!text.empty() && isGrounded(text, symptom, hypothesis.causalChain)) {
                return text;
            }
        }
        VLOG_DEBUG(QStringLiteral("NarrativeGenerator"),
                   QStringLiteral("generate"),
                   QStringLiteral("draft_rejected"),
                   QStringLiteral("ungrounded_or_empty"),
                   QStringLiteral("grounding_check"),
                   vita::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"debtType", toDebtTypeString(hypothesis.debtType)}}));
        return templateNarrative(symptom, hypothesis, observations);
    });
}

std::string TemplateNarrativeGenerator::templateNarrative(
    const std::string &symptom,
    const Hypothesis &hypothesis,
    const std::vector<ToolObservation> &observations)
{
    const std::string confidence = std::to_string(static_cast<int>(hypothesis.confidence * 100.0));
    const std::string chain = joinChain(hypothesis.causalChain, " → ");
    const std::string lowered = toLowerAscii(symptom);

    std::string firstDetail;
    for (const auto &observation : observations) {
        if (!observation.detail.empty()) {
            firstDetail = observation.detail;
            break;
        }
    }

    std::string why;
    std::string evidence;
    std::string fix;
    switch (hypothesis.debtType) {
    case DebtType::Metabolic:
        why = "Looks like your " + lowered + " is connected to what you ate recently";
        evidence = firstDetail.empty()
            ? "Your glucose and meal data point to a metabolic pattern (" + confidence + "% confidence): " + chain + "."
            : "Here's what the data shows (" + confidence + "% confidence): " + firstDetail + ".";
        fix = "A short walk after your next meal could help smooth things out.";
        break;
    case DebtType::Digital:
        why = "Your " + lowered + " seems tied to your screen time patterns";
        evidence = firstDetail.empty()
            ? "Extended passive screen time has been building up attention fatigue (" + confidence + "% confidence): " + chain + "."
            : "The data shows (" + confidence + "% confidence): " + firstDetail + ".";
        fix = "Taking a quick break from screens when you notice the pull might help.";
        break;
    case DebtType::Somatic:
        why = "Your " + lowered + " looks like it has roots in your environment or recovery";
        evidence = firstDetail.empty()
            ? "Sleep and environmental factors are playing a role (" + confidence + "% confidence): " + chain + "."
            : "Here's what stands out (" + confidence + "% confidence): " + firstDetail + ".";
        fix = "Getting some extra rest could make a real difference.";
        break;
    }

    return why + ". " + evidence + " " + fix;
}

bool TemplateNarrativeGenerator::isGrounded(const std::string &text,
                                            const std::string &symptom,
                                            const std::vector<std::string> &causalChain)
{
    const std::string lowered = toLowerAscii(text);
    for (const auto &step : causalChain) {
        if (containsAny(lowered, significantWords(step))) {
            return true;
        }
    }
    return containsAny(lowered, significantWords(symptom));
}

std::string TemplateNarrativeGenerator::buildPrompt(const std::string &symptom,
                                                    const Hypothesis &hypothesis,
                                                    const std::vector<ToolObservation> &observations)
{
    nlohmann::json context{
        {"symptom", symptom},
        {"debtType", hypothesis.debtType},
        {"confidence", hypothesis.confidence},
        {"causalChain", hypothesis.causalChain},
        {"observations", observations}
    };
    return "Explain in two supportive sentences why the user reports \"" + symptom
        + "\", using only this evidence:\n"
        + context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace vita
