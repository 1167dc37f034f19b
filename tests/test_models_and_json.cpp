#include <QtTest/QtTest>

#include <cmath>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testIsoTimestamps();
    void testMealRoundTrip();
    void testGlucoseRoundTrip();
    void testEdgeRoundTrip();
    void testMissingFieldsDefaults();
    void testEnumStrings();
    void testDerivedMealValues();
    void testWindowAndPredicates();
    void testClampUnit_data();
    void testClampUnit();
    void testExplanationAndCounterfactualJson();

private:
    static qint64 toSeconds(std::chrono::system_clock::time_point t)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            t.time_since_epoch()).count();
    }
};

void ModelsJsonTests::testIsoTimestamps()
{
    const auto t = std::chrono::system_clock::time_point(std::chrono::seconds(1767225600));
    QCOMPARE(QString::fromStdString(vita::toIso8601Utc(t)), QStringLiteral("2026-01-01T00:00:00Z"));
    QCOMPARE(toSeconds(vita::fromIso8601Utc("2026-01-01T00:00:00Z")), qint64(1767225600));
    QCOMPARE(toSeconds(vita::fromIso8601Utc("not a date")), qint64(0));
}

void ModelsJsonTests::testMealRoundTrip()
{
    vita::MealEvent meal;
    meal.id = 7;
    meal.timestamp = std::chrono::system_clock::now();
    meal.source = "photo";
    meal.cookingMethod = "pressure_cooked";
    meal.ingredients.push_back(vita::Ingredient{"rajma", 120.0, 29.0, "protein"});
    meal.estimatedGlycemicLoad = 18.5;

    nlohmann::json j = meal;
    QVERIFY(!j.contains("bioavailabilityModifier"));
    const auto parsed = j.get<vita::MealEvent>();

    QCOMPARE(parsed.id, int64_t(7));
    QCOMPARE(QString::fromStdString(parsed.cookingMethod), QStringLiteral("pressure_cooked"));
    QCOMPARE(static_cast<size_t>(parsed.ingredients.size()), static_cast<size_t>(1));
    QCOMPARE(*parsed.ingredients[0].glycemicIndex, 29.0);
    QCOMPARE(*parsed.estimatedGlycemicLoad, 18.5);
    QVERIFY(!parsed.bioavailabilityModifier.has_value());
    QCOMPARE(toSeconds(parsed.timestamp), toSeconds(meal.timestamp));
}

void ModelsJsonTests::testGlucoseRoundTrip()
{
    vita::GlucoseReading reading;
    reading.id = 3;
    reading.glucoseMgDL = 64.0;
    reading.timestamp = std::chrono::system_clock::now();
    reading.trend = vita::GlucoseTrend::RapidlyFalling;
    reading.energyState = vita::EnergyState::Crashing;
    reading.relatedMealEventId = 7;

    nlohmann::json j = reading;
    QCOMPARE(QString::fromStdString(j.at("trend").get<std::string>()), QStringLiteral("rapidly_falling"));
    const auto parsed = j.get<vita::GlucoseReading>();
    QCOMPARE(parsed.trend, vita::GlucoseTrend::RapidlyFalling);
    QCOMPARE(parsed.energyState, vita::EnergyState::Crashing);
    QCOMPARE(*parsed.relatedMealEventId, int64_t(7));
    QVERIFY(parsed.isCrash());
}

void ModelsJsonTests::testEdgeRoundTrip()
{
    vita::CausalEdge edge;
    edge.id = 11;
    edge.sourceNodeId = "meal_1";
    edge.targetNodeId = "glucose_4";
    edge.sourceType = vita::NodeType::Meal;
    edge.targetType = vita::NodeType::Glucose;
    edge.edgeType = vita::EdgeType::MealToGlucose;
    edge.causalStrength = 0.8;
    edge.confidence = 0.65;
    edge.temporalOffsetSeconds = 1800.0;
    edge.createdAt = std::chrono::system_clock::now();

    nlohmann::json j = edge;
    QCOMPARE(QString::fromStdString(j.at("edgeType").get<std::string>()), QStringLiteral("meal_to_glucose"));
    const auto parsed = j.get<vita::CausalEdge>();
    QCOMPARE(*parsed.id, int64_t(11));
    QCOMPARE(*parsed.sourceType, vita::NodeType::Meal);
    QCOMPARE(*parsed.targetType, vita::NodeType::Glucose);
    QCOMPARE(parsed.edgeType, vita::EdgeType::MealToGlucose);
    QCOMPARE(parsed.temporalOffsetSeconds, 1800.0);
    QVERIFY(parsed.isStrongCausal());
    QCOMPARE(toSeconds(parsed.createdAt), toSeconds(edge.createdAt));
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto edge = nlohmann::json{{"sourceNodeId", "a"}, {"edgeType", "unheard_of"}}.get<vita::CausalEdge>();
    QVERIFY(!edge.id.has_value());
    QVERIFY(!edge.sourceType.has_value());
    QCOMPARE(edge.edgeType, vita::EdgeType::Causal);
    QCOMPARE(edge.confidence, 0.0);

    const auto condition = nlohmann::json::object().get<vita::EnvironmentalCondition>();
    QCOMPARE(condition.temperatureCelsius, 20.0);
    QCOMPARE(condition.humidity, 50.0);
    QCOMPARE(condition.aqiUS, 0);

    const auto event = nlohmann::json{{"category", "zombie_scrolling"}}.get<vita::BehavioralEvent>();
    QCOMPARE(event.category, vita::BehaviorCategory::ZombieScrolling);
    QVERIFY(!event.dopamineDebtScore.has_value());

    const auto sample = nlohmann::json{{"metricType", "bogus"}, {"value", 5}}.get<vita::PhysiologicalSample>();
    QCOMPARE(sample.metricType, vita::MetricType::HrvSdnn);
    QCOMPARE(sample.value, 5.0);
}

void ModelsJsonTests::testEnumStrings()
{
    QCOMPARE(QString::fromStdString(vita::toDebtTypeString(vita::DebtType::Somatic)), QStringLiteral("somatic"));
    QVERIFY(!vita::parseDebtTypeString("emotional").has_value());
    QCOMPARE(*vita::parseNodeTypeString("environmental"), vita::NodeType::Environmental);
    QVERIFY(!vita::parseNodeTypeString("").has_value());
    QCOMPARE(vita::parseEdgeTypeString("skin_to_symptom"), vita::EdgeType::SkinToSymptom);
    QCOMPARE(*vita::parseMetricTypeString("sleep_analysis"), vita::MetricType::SleepAnalysis);
    QCOMPARE(vita::parseEffortString("trivial"), vita::Effort::Trivial);
    QCOMPARE(QString::fromStdString(vita::toMaturityPhaseString(vita::MaturityPhase::Correlation)),
             QStringLiteral("correlation"));

    nlohmann::json type = vita::DebtType::Digital;
    QCOMPARE(QString::fromStdString(type.get<std::string>()), QStringLiteral("digital"));
    QCOMPARE(nlohmann::json("unknown").get<vita::DebtType>(), vita::DebtType::Metabolic);
}

void ModelsJsonTests::testDerivedMealValues()
{
    vita::MealEvent meal;
    QCOMPARE(QString::fromStdString(meal.displayName()), QStringLiteral("meal"));
    QCOMPARE(meal.glycemicLoad(), 0.0);

    meal.source = "Lunch";
    QCOMPARE(QString::fromStdString(meal.displayName()), QStringLiteral("Lunch"));

    meal.ingredients.push_back(vita::Ingredient{"white rice", 150.0, 73.0, "carb"});
    meal.ingredients.push_back(vita::Ingredient{"ghee", 10.0, std::nullopt, "fat"});
    QCOMPARE(QString::fromStdString(meal.displayName()), QStringLiteral("white rice"));
    QVERIFY(std::abs(meal.glycemicLoad() - 73.0 * 150.0 * 0.7 / 100.0) < 1e-9);

    meal.estimatedGlycemicLoad = 12.0;
    QCOMPARE(meal.glycemicLoad(), 12.0);
}

void ModelsJsonTests::testWindowAndPredicates()
{
    const auto now = std::chrono::system_clock::now();
    const auto window = vita::TimeWindow::lastHours(1.5, now);
    QVERIFY(window.to == now);
    QVERIFY(window.from == now - std::chrono::minutes(90));
    QVERIFY(window.contains(window.from));
    QVERIFY(window.contains(now));
    QVERIFY(!window.contains(now + std::chrono::seconds(1)));

    vita::BehavioralEvent event;
    event.durationSeconds = 1800.0;
    QVERIFY(!event.isPassive());
    event.category = vita::BehaviorCategory::PassiveConsumption;
    QVERIFY(event.isPassive());
    QCOMPARE(event.minutes(), 30.0);

    vita::CausalEdge edge;
    edge.causalStrength = 0.7;
    edge.confidence = 0.59;
    QVERIFY(!edge.isStrongCausal());
}

void ModelsJsonTests::testClampUnit_data()
{
    QTest::addColumn<double>("value");
    QTest::addColumn<double>("expected");

    QTest::newRow("above one") << 1.7 << 1.0;
    QTest::newRow("below zero") << -0.2 << 0.0;
    QTest::newRow("inside") << 0.42 << 0.42;
    QTest::newRow("upper bound") << 1.0 << 1.0;
    QTest::newRow("lower bound") << 0.0 << 0.0;
}

void ModelsJsonTests::testClampUnit()
{
    QFETCH(double, value);
    QFETCH(double, expected);

    QCOMPARE(vita::clampUnit(value), expected);
}

void ModelsJsonTests::testExplanationAndCounterfactualJson()
{
    vita::CausalExplanation explanation{"Tired", {"Roti (GL 30)", "Glucose crash detected"}, 0.8, 0.76, "text"};
    nlohmann::json j = explanation;
    const auto parsed = j.get<vita::CausalExplanation>();
    QCOMPARE(static_cast<size_t>(parsed.causalChain.size()), static_cast<size_t>(2));
    QCOMPARE(parsed.strength, 0.8);
    QCOMPARE(QString::fromStdString(parsed.narrative), QStringLiteral("text"));

    const nlohmann::json counterfactual = vita::Counterfactual{"Walk after meals", 0.6, vita::Effort::Trivial, 0.7};
    QCOMPARE(QString::fromStdString(counterfactual.at("effort").get<std::string>()), QStringLiteral("trivial"));

    vita::ToolObservation observation;
    observation.toolName = "MetabolicScanner";
    observation.evidence = {{vita::DebtType::Metabolic, 0.8}, {vita::DebtType::Digital, -0.3}};
    const nlohmann::json obs = observation;
    QCOMPARE(obs.at("evidence").at("digital").get<double>(), -0.3);
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
