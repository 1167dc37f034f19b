#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/CausalCli.hpp"
#include "common/json_utils.hpp"

class CausalCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testUsageErrors();
    void testInvalidOptions();
    void testIngestAndScore();
    void testExplainOnEmptyHistory();
    void testInterventionsFallBackToGeneralSet();
    void testCounterfactualForNode();
    void testPathsFromCategory();
    void testLearnAndPhase();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::filesystem::path dbPath() const;
    QString writeIngestFile(const nlohmann::json &payload) const;
    int runCli(const QStringList &args, std::string &out);
};

void CausalCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("VITA_DB_PATH");
}

void CausalCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path CausalCliTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/vita/vita.db";
}

void CausalCliTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

QString CausalCliTests::writeIngestFile(const nlohmann::json &payload) const
{
    const QString path = m_tempDir.filePath(QStringLiteral("ingest.json"));
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QByteArray::fromStdString(payload.dump()));
    }
    return path;
}

int CausalCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    vita::CausalCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void CausalCliTests::testUsageErrors()
{
    std::string output;
    QCOMPARE(runCli({"vita-causal"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Usage:")));

    QCOMPARE(runCli({"vita-causal", "diagnose"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("vita-causal explain")));

    QCOMPARE(runCli({"vita-causal", "explain"}, output), 1);
    QCOMPARE(runCli({"vita-causal", "counterfactual"}, output), 1);
    QCOMPARE(runCli({"vita-causal", "ingest"}, output), 1);
}

void CausalCliTests::testInvalidOptions()
{
    std::string output;
    QCOMPARE(runCli({"vita-causal", "explain", "--symptom", "Tired", "--window-hours", "-2"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Invalid window")));

    QCOMPARE(runCli({"vita-causal", "score", "--hours", "abc"}, output), 1);

    QCOMPARE(runCli({"vita-causal", "score", "--format", "xml"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Invalid format")));

    QCOMPARE(runCli({"vita-causal", "paths", "--from", "mood"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Unknown category")));

    QCOMPARE(runCli({"vita-causal", "ingest", "--input", m_tempDir.filePath(QStringLiteral("missing.json"))}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Failed to read ingest file")));
}

void CausalCliTests::testIngestAndScore()
{
    resetDb();

    const auto now = std::chrono::system_clock::now();
    const nlohmann::json payload{
        {"behaviors", nlohmann::json::array({
            {{"timestamp", vita::toIso8601Utc(now - std::chrono::hours(1))},
             {"durationSeconds", 1800},
             {"category", "passive_consumption"},
             {"appName", "video"},
             {"dopamineDebtScore", 50}},
        })},
        {"samples", nlohmann::json::array({
            {{"timestamp", vita::toIso8601Utc(now - std::chrono::hours(9))},
             {"metricType", "sleep_analysis"},
             {"value", 8.0},
             {"unit", "h"}},
        })},
    };

    std::string output;
    QCOMPARE(runCli({"vita-causal", "ingest", "--input", writeIngestFile(payload)}, output), 0);
    const auto counts = nlohmann::json::parse(output);
    QCOMPARE(counts.at("behaviors").get<int>(), 1);
    QCOMPARE(counts.at("samples").get<int>(), 1);
    QCOMPARE(counts.at("meals").get<int>(), 0);

    QCOMPARE(runCli({"vita-causal", "score", "--format", "json"}, output), 0);
    const auto scores = nlohmann::json::parse(output);
    QCOMPARE(scores.at("windowHours").get<double>(), 6.0);
    QCOMPARE(scores.at("metabolic").get<double>(), 0.0);
    QCOMPARE(scores.at("digital").get<double>(), 50.0);
    QCOMPARE(scores.at("somatic").get<double>(), 0.0);

    QCOMPARE(runCli({"vita-causal", "score"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("- Digital: 50.0")));
}

void CausalCliTests::testExplainOnEmptyHistory()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"vita-causal", "explain", "--symptom", "Tired", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(QString::fromStdString(parsed.at("symptom").get<std::string>()), QStringLiteral("Tired"));
    QCOMPARE(QString::fromStdString(parsed.at("phase").get<std::string>()), QStringLiteral("passive"));
    QVERIFY(parsed.at("explanations").is_array());
    QVERIFY(parsed.at("explanations").empty());

    QCOMPARE(runCli({"vita-causal", "explain", "--symptom", "Tired"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("# Causal Explanation")));
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("No explanation cleared the confidence floor.")));
}

void CausalCliTests::testInterventionsFallBackToGeneralSet()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"vita-causal", "interventions", "--symptom", "Tired", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.at("explanations").empty());
    QCOMPARE(static_cast<size_t>(parsed.at("counterfactuals").size()), static_cast<size_t>(3));
    for (const auto &item : parsed.at("counterfactuals")) {
        QVERIFY(item.contains("description"));
        QVERIFY(item.contains("effort"));
    }
}

void CausalCliTests::testCounterfactualForNode()
{
    std::string output;
    QCOMPARE(runCli({"vita-causal", "counterfactual", "--node", "glucose_spike_12", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(QString::fromStdString(parsed.at("node").get<std::string>()), QStringLiteral("glucose_spike_12"));
    QVERIFY(!parsed.at("counterfactuals").empty());

    QCOMPARE(runCli({"vita-causal", "counterfactual", "--node", "screen_time"}, output), 0);
    QVERIFY(QString::fromStdString(output).startsWith(QStringLiteral("# Counterfactuals for screen_time")));
}

void CausalCliTests::testPathsFromCategory()
{
    resetDb();

    const nlohmann::json payload{
        {"edges", nlohmann::json::array({
            {{"sourceNodeId", "meal_1"}, {"targetNodeId", "glucose_1"},
             {"sourceType", "meal"}, {"targetType", "glucose"},
             {"edgeType", "meal_to_glucose"}, {"causalStrength", 0.8}, {"confidence", 0.6}},
            {{"sourceNodeId", "glucose_1"}, {"targetNodeId", "symptom_tired"},
             {"sourceType", "glucose"}, {"targetType", "symptom"},
             {"edgeType", "causal"}, {"causalStrength", 0.5}, {"confidence", 0.6}},
        })},
    };

    std::string output;
    QCOMPARE(runCli({"vita-causal", "ingest", "--input", writeIngestFile(payload)}, output), 0);

    QCOMPARE(runCli({"vita-causal", "paths", "--from", "Meal", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(QString::fromStdString(parsed.at("from").get<std::string>()), QStringLiteral("meal"));
    QCOMPARE(static_cast<size_t>(parsed.at("paths").size()), static_cast<size_t>(1));
    const auto &path = parsed.at("paths").front();
    QCOMPARE(static_cast<size_t>(path.at("nodes").size()), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(path.at("nodes").back().get<std::string>()), QStringLiteral("symptom"));
    QVERIFY(std::abs(path.at("strength").get<double>() - 0.4) < 1e-9);

    QCOMPARE(runCli({"vita-causal", "paths", "--from", "environmental"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("No paths reach a symptom.")));
}

void CausalCliTests::testLearnAndPhase()
{
    resetDb();

    std::string output;
    QCOMPARE(runCli({"vita-causal", "learn", "--hours", "12"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Meals scanned: 0")));
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Edges created: 0")));

    QCOMPARE(runCli({"vita-causal", "phase"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Phase: passive")));
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Max tools: 0")));
}

QTEST_MAIN(CausalCliTests)
#include "test_causal_cli.moc"
