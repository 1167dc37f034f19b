#include "cli/CausalCli.hpp"

#include <iostream>
#include <optional>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "engine/causality_engine.hpp"
#include "engine/signal_math.hpp"
#include "store/sqlite_health_store.hpp"

namespace vita {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  vita-causal explain --symptom TEXT [--window-hours N] [--format markdown|json]\n"
        "  vita-causal counterfactual --node ID [--format markdown|json]\n"
        "  vita-causal interventions --symptom TEXT [--format markdown|json]\n"
        "  vita-causal paths --from CATEGORY [--format markdown|json]\n"
        "  vita-causal learn [--hours N]\n"
        "  vita-causal score [--hours N] [--format markdown|json]\n"
        "  vita-causal phase\n"
        "  vita-causal ingest --input PATH\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

// Positive number for `key`, `fallback` when absent, nullopt when malformed.
std::optional<double> getHours(const QStringList &args, const QString &key, double fallback)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const double hours = value.toDouble(&ok);
    if (!ok || hours <= 0.0) {
        return std::nullopt;
    }
    return hours;
}

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

std::string joinChain(const std::vector<std::string> &chain)
{
    std::string joined;
    for (const auto &step : chain) {
        if (!joined.empty()) {
            joined += " → ";
        }
        joined += step;
    }
    return joined;
}

std::string percent(double value)
{
    return formatFixed(value * 100.0, 0) + "%";
}

void renderExplanationsMarkdown(const std::string &symptom,
                                const std::vector<CausalExplanation> &explanations)
{
    std::cout << "# Causal Explanation\n\n";
    std::cout << "Symptom: " << symptom << "\n\n";
    std::cout << "## Root Causes\n\n";

    if (explanations.empty()) {
        std::cout << "No explanation cleared the confidence floor.\n";
        return;
    }

    int rank = 1;
    for (const auto &explanation : explanations) {
        std::cout << "### " << rank++ << ". " << joinChain(explanation.causalChain) << "\n\n";
        std::cout << "- Strength: " << percent(explanation.strength) << "\n";
        std::cout << "- Confidence: " << percent(explanation.confidence) << "\n\n";
        std::cout << explanation.narrative << "\n\n";
    }
}

void renderCounterfactualsMarkdown(const std::vector<Counterfactual> &counterfactuals)
{
    if (counterfactuals.empty()) {
        std::cout << "No interventions matched.\n";
        return;
    }
    for (const auto &item : counterfactuals) {
        std::cout << "- " << item.description << " (impact " << percent(item.impact)
                  << ", effort " << toEffortString(item.effort)
                  << ", confidence " << percent(item.confidence) << ")\n";
    }
}

template <typename T>
std::size_t ingestArray(const nlohmann::json &payload,
                        const char *key,
                        HealthDataStore &store,
                        void (HealthDataStore::*add)(T &))
{
    if (!payload.contains(key) || !payload.at(key).is_array()) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto &item : payload.at(key)) {
        T record = item.get<T>();
        (store.*add)(record);
        ++count;
    }
    return count;
}

} // namespace

int CausalCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    VLOG_INFO(QStringLiteral("CausalCli"),
              QStringLiteral("run"),
              QStringLiteral("causal_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              vita::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    if (command == QStringLiteral("explain")) {
        return runExplain(args);
    }
    if (command == QStringLiteral("counterfactual")) {
        return runCounterfactual(args);
    }
    if (command == QStringLiteral("interventions")) {
        return runInterventions(args);
    }
    if (command == QStringLiteral("paths")) {
        return runPaths(args);
    }
    if (command == QStringLiteral("learn")) {
        return runLearn(args);
    }
    if (command == QStringLiteral("score")) {
        return runScore(args);
    }
    if (command == QStringLiteral("phase")) {
        return runPhase(args);
    }
    if (command == QStringLiteral("ingest")) {
        return runIngest(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int CausalCli::runExplain(const QStringList &args)
{
    const QString symptom = getArgValue(args, QStringLiteral("--symptom"));
    if (symptom.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    AgentConfig config;
    const auto windowHours = getHours(args, QStringLiteral("--window-hours"), config.windowHours);
    if (!windowHours) {
        std::cerr << "Invalid window. Use a positive number of hours." << std::endl;
        return 1;
    }
    config.windowHours = *windowHours;

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    try {
        SqliteHealthStore store;
        CausalityEngine engine(store, config);
        const std::string text = symptom.toStdString();
        const auto explanations = engine.querySymptom(text);

        VLOG_INFO(QStringLiteral("CausalCli"),
                  QStringLiteral("runExplain"),
                  QStringLiteral("cli_explain"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("react_agent"),
                  vita::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"explanations", explanations.size()},
                                  {"format", format.toStdString()}}));
        if (format == QStringLiteral("json")) {
            nlohmann::json payload;
            payload["symptom"] = text;
            payload["windowHours"] = config.windowHours;
            payload["phase"] = toMaturityPhaseString(engine.phase());
            payload["explanations"] = explanations;
            std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        } else {
            renderExplanationsMarkdown(text, explanations);
        }
    } catch (const std::exception &ex) {
        std::cerr << "Failed to explain symptom: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

int CausalCli::runCounterfactual(const QStringList &args)
{
    const QString node = getArgValue(args, QStringLiteral("--node"));
    if (node.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const InterventionCalculator calculator;
    const auto counterfactuals = calculator.generateCounterfactuals(node.toStdString());

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["node"] = node.toStdString();
        payload["counterfactuals"] = counterfactuals;
        std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        std::cout << "# Counterfactuals for " << node.toStdString() << "\n\n";
        renderCounterfactualsMarkdown(counterfactuals);
    }

    return 0;
}

int CausalCli::runInterventions(const QStringList &args)
{
    const QString symptom = getArgValue(args, QStringLiteral("--symptom"));
    if (symptom.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    try {
        SqliteHealthStore store;
        CausalityEngine engine(store);
        const std::string text = symptom.toStdString();
        const auto explanations = engine.querySymptom(text);
        const auto counterfactuals = engine.generateCounterfactual(text, explanations);

        VLOG_INFO(QStringLiteral("CausalCli"),
                  QStringLiteral("runInterventions"),
                  QStringLiteral("cli_interventions"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("intervention_templates"),
                  vita::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"explanations", explanations.size()},
                                  {"counterfactuals", counterfactuals.size()}}));
        if (format == QStringLiteral("json")) {
            nlohmann::json payload;
            payload["symptom"] = text;
            payload["explanations"] = explanations;
            payload["counterfactuals"] = counterfactuals;
            std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        } else {
            renderExplanationsMarkdown(text, explanations);
            std::cout << "## What Could Help\n\n";
            renderCounterfactualsMarkdown(counterfactuals);
        }
    } catch (const std::exception &ex) {
        std::cerr << "Failed to compute interventions: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

int CausalCli::runPaths(const QStringList &args)
{
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    if (fromValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const auto source = parseNodeTypeString(fromValue.toLower().toStdString());
    if (!source) {
        std::cerr << "Unknown category. Use meal, environmental, behavioral, glucose, "
                     "physiological or symptom."
                  << std::endl;
        return 1;
    }

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    try {
        SqliteHealthStore store;
        CausalityEngine engine(store);
        const auto paths = engine.causalPaths(*source);

        if (format == QStringLiteral("json")) {
            nlohmann::json payload;
            payload["from"] = toNodeTypeString(*source);
            payload["paths"] = nlohmann::json::array();
            for (const auto &path : paths) {
                nlohmann::json nodes = nlohmann::json::array();
                for (const NodeType node : path.nodes) {
                    nodes.push_back(toNodeTypeString(node));
                }
                payload["paths"].push_back({{"nodes", nodes}, {"strength", path.strength}});
            }
            std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        } else {
            std::cout << "# Causal Paths from " << toNodeTypeString(*source) << "\n\n";
            if (paths.empty()) {
                std::cout << "No paths reach a symptom.\n";
            }
            for (const auto &path : paths) {
                std::vector<std::string> names;
                for (const NodeType node : path.nodes) {
                    names.push_back(toNodeTypeString(node));
                }
                std::cout << "- " << joinChain(names) << " (strength "
                          << formatFixed(path.strength, 3) << ")\n";
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "Failed to trace paths: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

int CausalCli::runLearn(const QStringList &args)
{
    const auto hours = getHours(args, QStringLiteral("--hours"), 24.0);
    if (!hours) {
        std::cerr << "Invalid window. Use a positive number of hours." << std::endl;
        return 1;
    }

    try {
        SqliteHealthStore store;
        CausalityEngine engine(store);
        const BatchUpdateSummary summary = engine.updateGraph(*hours);

        std::cout << "Meals scanned: " << summary.mealsScanned << "\n";
        std::cout << "Meals with glucose response: " << summary.mealsWithResponse << "\n";
        std::cout << "Edges updated: " << summary.edgesUpdated << "\n";
        std::cout << "Edges created: " << summary.edgesCreated << std::endl;
    } catch (const std::exception &ex) {
        std::cerr << "Failed to update edges: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

int CausalCli::runScore(const QStringList &args)
{
    const auto hours = getHours(args, QStringLiteral("--hours"), 6.0);
    if (!hours) {
        std::cerr << "Invalid window. Use a positive number of hours." << std::endl;
        return 1;
    }

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    try {
        SqliteHealthStore store;
        CausalityEngine engine(store);
        const DebtScores scores = engine.debtScores(*hours);

        if (format == QStringLiteral("json")) {
            nlohmann::json payload;
            payload["windowHours"] = *hours;
            payload["metabolic"] = scores.metabolic;
            payload["digital"] = scores.digital;
            payload["somatic"] = scores.somatic;
            std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        } else {
            std::cout << "# Debt Scores (last " << formatFixed(*hours, 1) << "h)\n\n";
            std::cout << "- Metabolic: " << formatFixed(scores.metabolic, 1) << "\n";
            std::cout << "- Digital: " << formatFixed(scores.digital, 1) << "\n";
            std::cout << "- Somatic: " << formatFixed(scores.somatic, 1) << "\n";
        }
    } catch (const std::exception &ex) {
        std::cerr << "Failed to compute scores: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

int CausalCli::runPhase(const QStringList &args)
{
    Q_UNUSED(args);

    try {
        SqliteHealthStore store;
        const EngineMaturityTracker tracker(store);
        const MaturityPhase phase = tracker.currentPhase();
        const PhaseConfig config = EngineMaturityTracker::configFor(phase);

        std::cout << "Phase: " << toMaturityPhaseString(phase) << "\n";
        std::cout << "ReAct agent: " << (config.useReAct ? "on" : "off") << "\n";
        std::cout << "Rule engine: " << (config.useRules ? "on" : "off") << "\n";
        std::cout << "Language model: " << (config.useLLM ? "on" : "off") << "\n";
        std::cout << "Max tools: " << config.maxTools << std::endl;
    } catch (const std::exception &ex) {
        std::cerr << "Failed to read maturity phase: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

int CausalCli::runIngest(const QStringList &args)
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const nlohmann::json payload = readJsonFile(inputPath);
    if (!payload.is_object()) {
        std::cerr << "Failed to read ingest file." << std::endl;
        return 1;
    }

    try {
        SqliteHealthStore store;
        nlohmann::json counts;
        counts["glucose"] = ingestArray<GlucoseReading>(payload, "glucose", store,
                                                        &HealthDataStore::addGlucoseReading);
        counts["meals"] = ingestArray<MealEvent>(payload, "meals", store, &HealthDataStore::addMeal);
        counts["behaviors"] = ingestArray<BehavioralEvent>(payload, "behaviors", store,
                                                           &HealthDataStore::addBehavior);
        counts["environment"] = ingestArray<EnvironmentalCondition>(payload, "environment", store,
                                                                    &HealthDataStore::addEnvironment);
        counts["samples"] = ingestArray<PhysiologicalSample>(payload, "samples", store,
                                                             &HealthDataStore::addSample);
        counts["edges"] = ingestArray<CausalEdge>(payload, "edges", store, &HealthDataStore::addEdge);

        VLOG_INFO(QStringLiteral("CausalCli"),
                  QStringLiteral("runIngest"),
                  QStringLiteral("cli_ingest"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("sqlite_insert"),
                  vita::logging::defaultWho(),
                  QString(),
                  counts);
        std::cout << counts.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } catch (const std::exception &ex) {
        std::cerr << "Failed to ingest records: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace vita
