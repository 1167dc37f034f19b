#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <cmath>

#include "engine/tool_registry.hpp"
#include "engine/tools/digital_friction_analyzer.hpp"
#include "engine/tools/environmental_stress_analyzer.hpp"
#include "engine/tools/inflammation_tracker.hpp"
#include "engine/tools/metabolic_scanner.hpp"
#include "engine/tools/sleep_quality_analyzer.hpp"
#include "in_memory_health_store.hpp"

namespace {

bool near(double a, double b)
{
    return std::abs(a - b) < 1e-9;
}

double evidenceFor(const vita::ToolObservation &observation, vita::DebtType type)
{
    const auto it = observation.evidence.find(type);
    return it == observation.evidence.end() ? std::nan("") : it->second;
}

void addGlucose(InMemoryHealthStore &store,
                std::chrono::system_clock::time_point at,
                double value,
                vita::EnergyState state = vita::EnergyState::Stable)
{
    vita::GlucoseReading reading;
    reading.timestamp = at;
    reading.glucoseMgDL = value;
    reading.energyState = state;
    store.addGlucoseReading(reading);
}

void addPassive(InMemoryHealthStore &store,
                std::chrono::system_clock::time_point at,
                double minutes,
                std::optional<double> dopamineDebt = std::nullopt)
{
    vita::BehavioralEvent event;
    event.timestamp = at;
    event.durationSeconds = minutes * 60.0;
    event.category = vita::BehaviorCategory::ZombieScrolling;
    event.appName = "feed";
    event.dopamineDebtScore = dopamineDebt;
    store.addBehavior(event);
}

void addSample(InMemoryHealthStore &store,
               vita::MetricType type,
               std::chrono::system_clock::time_point at,
               double value)
{
    vita::PhysiologicalSample sample;
    sample.metricType = type;
    sample.timestamp = at;
    sample.value = value;
    store.addSample(sample);
}

} // namespace

class AnalysisToolTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDigitalReactiveScrollingPointsToMetabolic();
    void testDigitalGenuineScreenTime();
    void testDigitalNoPassiveEvents();
    void testMetabolicInsufficientData();
    void testMetabolicCrashWithMealAndHrvDrop();
    void testInflammationDefaultsToPopulationBaseline();
    void testSleepDeficitWithoutSamples();
    void testEnvironmentalNoData();
    void testEnvironmentalHighAqi();
    void testRegistryPrefersToolForTopHypothesis();
    void testRegistryExhaustsTools();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void AnalysisToolTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void AnalysisToolTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void AnalysisToolTests::testDigitalReactiveScrollingPointsToMetabolic()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    const auto crash = now - std::chrono::hours(2);
    addGlucose(store, crash, 65.0, vita::EnergyState::Crashing);
    addPassive(store, crash + std::chrono::minutes(10), 40.0);

    const vita::DigitalFrictionAnalyzer analyzer;
    const auto observation = analyzer.analyze({}, store, vita::TimeWindow::lastHours(6.0, now));

    QCOMPARE(QString::fromStdString(observation.toolName), QStringLiteral("DigitalFrictionAnalyzer"));
    QCOMPARE(observation.evidence.size(), static_cast<size_t>(2));
    QVERIFY(near(evidenceFor(observation, vita::DebtType::Digital), 0.0));
    QVERIFY(near(evidenceFor(observation, vita::DebtType::Metabolic), 0.15));
    QVERIFY(near(observation.confidence, 0.8));
    QCOMPARE(QString::fromStdString(observation.detail),
             QStringLiteral("Genuine digital: 0min, Reactive scrolling: 40min"));
}

void AnalysisToolTests::testDigitalGenuineScreenTime()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    addPassive(store, now - std::chrono::hours(3), 90.0, 70.0);

    const vita::DigitalFrictionAnalyzer analyzer;
    const auto observation = analyzer.analyze({}, store, vita::TimeWindow::lastHours(6.0, now));

    QVERIFY(near(evidenceFor(observation, vita::DebtType::Digital), 1.0));
    QCOMPARE(observation.evidence.count(vita::DebtType::Metabolic), static_cast<size_t>(0));
}

void AnalysisToolTests::testDigitalNoPassiveEvents()
{
    InMemoryHealthStore store;
    vita::BehavioralEvent work;
    work.timestamp = std::chrono::system_clock::now() - std::chrono::hours(1);
    work.durationSeconds = 3600.0;
    work.category = vita::BehaviorCategory::ActiveWork;
    store.addBehavior(work);

    const vita::DigitalFrictionAnalyzer analyzer;
    const auto observation = analyzer.analyze({}, store, vita::TimeWindow::lastHours(6.0));

    QVERIFY(near(evidenceFor(observation, vita::DebtType::Digital), 0.0));
    QCOMPARE(QString::fromStdString(observation.detail), QStringLiteral("No passive screen time detected"));
}

void AnalysisToolTests::testMetabolicInsufficientData()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    addGlucose(store, now - std::chrono::hours(1), 110.0);
    addGlucose(store, now - std::chrono::minutes(30), 120.0);

    const vita::MetabolicScanner scanner;
    const auto observation = scanner.analyze({}, store, vita::TimeWindow::lastHours(6.0, now));

    QVERIFY(near(evidenceFor(observation, vita::DebtType::Metabolic), 0.0));
    QVERIFY(near(observation.confidence, 0.1));
    QCOMPARE(QString::fromStdString(observation.detail),
             QStringLiteral("Insufficient glucose data (2 readings)"));
}

void AnalysisToolTests::testMetabolicCrashWithMealAndHrvDrop()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();

    vita::MealEvent meal;
    meal.timestamp = now - std::chrono::hours(3);
    meal.ingredients.push_back(vita::Ingredient{"white rice", 200.0, 73.0, "grain"});
    store.addMeal(meal);

    addGlucose(store, now - std::chrono::hours(3), 100.0);
    addGlucose(store, now - std::chrono::hours(2), 180.0);
    addGlucose(store, now - std::chrono::hours(1), 110.0);
    addGlucose(store, now - std::chrono::minutes(30), 120.0);

    addSample(store, vita::MetricType::HrvSdnn, now - std::chrono::minutes(150), 60.0);
    addSample(store, vita::MetricType::HrvSdnn, now - std::chrono::minutes(30), 30.0);

    const vita::MetabolicScanner scanner;
    const auto observation = scanner.analyze({}, store, vita::TimeWindow::lastHours(6.0, now));

    // Crash 70 mg/dL saturates severity, HRV drop is 1/3, meal attributed.
    QVERIFY(near(evidenceFor(observation, vita::DebtType::Metabolic), 0.5 + 0.1 + 0.2));
    QVERIFY(near(evidenceFor(observation, vita::DebtType::Digital), -0.3));
    QVERIFY(near(observation.confidence, 4.0 / 12.0));
    QCOMPARE(QString::fromStdString(observation.detail),
             QStringLiteral("Crash: 70mg/dL, HRV drop: 33%, Meal: white rice"));
}

void AnalysisToolTests::testInflammationDefaultsToPopulationBaseline()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    addSample(store, vita::MetricType::HrvSdnn, now - std::chrono::hours(1), 40.0);

    const vita::InflammationTracker tracker;
    const auto observation = tracker.analyze({}, store, vita::TimeWindow::lastHours(6.0, now));

    // HRV 40 against the 50 ms population baseline: deviation 0.2.
    QVERIFY(near(evidenceFor(observation, vita::DebtType::Metabolic), 0.2 * 0.4 * 0.6));
    QVERIFY(near(evidenceFor(observation, vita::DebtType::Somatic), 0.2 * 0.4 * 0.4));
    QVERIFY(near(observation.confidence, 1.0 / 20.0));
}

void AnalysisToolTests::testSleepDeficitWithoutSamples()
{
    InMemoryHealthStore store;

    const vita::SleepQualityAnalyzer analyzer;
    const auto observation = analyzer.analyze({}, store, vita::TimeWindow::lastHours(6.0));

    QVERIFY(near(evidenceFor(observation, vita::DebtType::Somatic), 0.6));
    QVERIFY(near(observation.confidence, 0.2));
    QVERIFY(QString::fromStdString(observation.detail).startsWith(
        QStringLiteral("Sleep: 0.0h (baseline: 7.5h)")));
}

void AnalysisToolTests::testEnvironmentalNoData()
{
    InMemoryHealthStore store;

    const vita::EnvironmentalStressAnalyzer analyzer;
    const auto observation = analyzer.analyze({}, store, vita::TimeWindow::lastHours(6.0));

    QVERIFY(near(evidenceFor(observation, vita::DebtType::Somatic), 0.0));
    QVERIFY(near(observation.confidence, 0.3));
}

void AnalysisToolTests::testEnvironmentalHighAqi()
{
    InMemoryHealthStore store;
    vita::EnvironmentalCondition condition;
    condition.timestamp = std::chrono::system_clock::now() - std::chrono::hours(1);
    condition.aqiUS = 160;
    condition.pollenIndex = 3;
    condition.temperatureCelsius = 25.0;
    store.addEnvironment(condition);

    const vita::EnvironmentalStressAnalyzer analyzer;
    const auto observation = analyzer.analyze({}, store, vita::TimeWindow::lastHours(6.0));

    QVERIFY(near(evidenceFor(observation, vita::DebtType::Somatic), 0.8 * 0.6 + 0.8 * 0.4));
    QVERIFY(near(observation.confidence, 0.7));
    QCOMPARE(QString::fromStdString(observation.detail),
             QStringLiteral("AQI: 160 (80%), Pollen: 3, Temp: 25C"));
}

void AnalysisToolTests::testRegistryPrefersToolForTopHypothesis()
{
    const vita::ToolRegistry registry;
    QCOMPARE(registry.allTools().size(), static_cast<size_t>(5));

    vita::AgentState state;
    vita::Hypothesis digital;
    digital.debtType = vita::DebtType::Digital;
    digital.confidence = 0.6;
    state.hypotheses.push_back(digital);

    const auto *first = registry.selectTool(state);
    QVERIFY(first != nullptr);
    QCOMPARE(QString::fromStdString(first->name()), QStringLiteral("DigitalFrictionAnalyzer"));

    vita::ToolObservation done;
    done.toolName = first->name();
    state.observations.push_back(done);

    const auto *second = registry.selectTool(state);
    QVERIFY(second != nullptr);
    QCOMPARE(QString::fromStdString(second->name()), QStringLiteral("MetabolicScanner"));
}

void AnalysisToolTests::testRegistryExhaustsTools()
{
    const vita::ToolRegistry registry;
    vita::AgentState state;
    for (const auto *tool : registry.allTools()) {
        vita::ToolObservation observation;
        observation.toolName = tool->name();
        state.observations.push_back(observation);
    }
    QVERIFY(registry.selectTool(state) == nullptr);
}

QTEST_MAIN(AnalysisToolTests)
#include "test_analysis_tools.moc"
