#include <QtTest/QtTest>

#include <QDateTime>
#include <QTemporaryDir>

#include <cmath>

#include "engine/debt_scorers.hpp"
#include "in_memory_health_store.hpp"

namespace {

bool near(double a, double b)
{
    return std::abs(a - b) < 1e-6;
}

// Today at the given local wall-clock hour.
std::chrono::system_clock::time_point localToday(int hour)
{
    const QDateTime dt(QDate::currentDate(), QTime(hour, 0));
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(dt.toMSecsSinceEpoch()));
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
                double dopamineDebt)
{
    vita::BehavioralEvent event;
    event.timestamp = at;
    event.durationSeconds = minutes * 60.0;
    event.category = vita::BehaviorCategory::PassiveConsumption;
    event.dopamineDebtScore = dopamineDebt;
    store.addBehavior(event);
}

} // namespace

class DebtScorerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testMetabolicNoMeals();
    void testMetabolicSpikeAndHrvDrop();
    void testMetabolicLateMealPenalty();
    void testMetabolicBioavailabilityLowersDebt();
    void testDigitalGenuineTimeAndDopamine();
    void testDigitalIgnoresReactiveScrolling();
    void testDigitalCapped();
    void testSomaticCombinesBands();
    void testSomaticEmptyStoreCountsMissingSleep();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void DebtScorerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void DebtScorerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void DebtScorerTests::testMetabolicNoMeals()
{
    InMemoryHealthStore store;
    addGlucose(store, std::chrono::system_clock::now() - std::chrono::hours(1), 180.0);

    QVERIFY(near(vita::MetabolicDebtScorer().score(store, 6.0), 0.0));
}

void DebtScorerTests::testMetabolicSpikeAndHrvDrop()
{
    InMemoryHealthStore store;
    const auto now = localToday(14);
    const auto mealTime = now - std::chrono::hours(2);

    vita::MealEvent meal;
    meal.timestamp = mealTime;
    meal.estimatedGlycemicLoad = 25.0;
    store.addMeal(meal);

    addGlucose(store, mealTime + std::chrono::minutes(30), 160.0);
    addGlucose(store, mealTime + std::chrono::minutes(90), 100.0);
    addSample(store, vita::MetricType::HrvSdnn, now - std::chrono::hours(48), 60.0);
    addSample(store, vita::MetricType::HrvSdnn, mealTime + std::chrono::minutes(90), 45.0);

    // 0.5 * 0.3 + 0.75 * 0.3 + 0.25 * 0.25 + 0.2 * 0.15
    QVERIFY(near(vita::MetabolicDebtScorer().score(store, 6.0, now), 46.75));
}

void DebtScorerTests::testMetabolicLateMealPenalty()
{
    InMemoryHealthStore store;
    const auto now = localToday(22);

    vita::MealEvent meal;
    meal.timestamp = now - std::chrono::hours(1);
    meal.estimatedGlycemicLoad = 50.0;
    store.addMeal(meal);

    QVERIFY(near(vita::MetabolicDebtScorer().score(store, 6.0, now), (0.3 + 0.03) * 1.3 * 100.0));
}

void DebtScorerTests::testMetabolicBioavailabilityLowersDebt()
{
    const auto now = localToday(14);

    InMemoryHealthStore plain;
    vita::MealEvent meal;
    meal.timestamp = now - std::chrono::hours(2);
    meal.estimatedGlycemicLoad = 30.0;
    plain.addMeal(meal);

    InMemoryHealthStore cooked;
    meal.bioavailabilityModifier = 1.4;
    cooked.addMeal(meal);

    InMemoryHealthStore degraded;
    meal.bioavailabilityModifier = 0.7;
    degraded.addMeal(meal);

    const vita::MetabolicDebtScorer scorer;
    QVERIFY(near(scorer.score(cooked, 6.0, now), 18.0));
    QVERIFY(near(scorer.score(plain, 6.0, now), 21.0));
    QVERIFY(near(scorer.score(degraded, 6.0, now), 24.0));
}

void DebtScorerTests::testDigitalGenuineTimeAndDopamine()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    addPassive(store, now - std::chrono::hours(2), 30.0, 50.0);

    QVERIFY(near(vita::DigitalDebtScorer().score(store, 6.0, now), 50.0));
}

void DebtScorerTests::testDigitalIgnoresReactiveScrolling()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    const auto crash = now - std::chrono::hours(2);
    addGlucose(store, crash, 62.0, vita::EnergyState::ReactiveLow);
    addPassive(store, crash + std::chrono::minutes(10), 45.0, 0.0);

    QVERIFY(near(vita::DigitalDebtScorer().score(store, 6.0, now), 0.0));

    InMemoryHealthStore empty;
    QVERIFY(near(vita::DigitalDebtScorer().score(empty, 6.0, now), 0.0));
}

void DebtScorerTests::testDigitalCapped()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();
    addPassive(store, now - std::chrono::hours(4), 120.0, 100.0);
    addPassive(store, now - std::chrono::hours(1), 30.0, 90.0);

    QVERIFY(near(vita::DigitalDebtScorer().score(store, 6.0, now), 100.0));
}

void DebtScorerTests::testSomaticCombinesBands()
{
    InMemoryHealthStore store;
    const auto now = std::chrono::system_clock::now();

    vita::EnvironmentalCondition condition;
    condition.timestamp = now - std::chrono::hours(1);
    condition.aqiUS = 160;
    condition.pollenIndex = 10;
    condition.temperatureCelsius = 39.0;
    store.addEnvironment(condition);

    vita::EnvironmentalCondition mild;
    mild.timestamp = now - std::chrono::hours(3);
    mild.aqiUS = 40;
    store.addEnvironment(mild);

    // Last night's sleep falls before the window but inside the lookback.
    addSample(store, vita::MetricType::SleepAnalysis, now - std::chrono::hours(10), 5.5);
    addSample(store, vita::MetricType::HrvSdnn, now - std::chrono::hours(2), 35.0);

    QVERIFY(near(vita::SomaticStressScorer().score(store, 6.0, now), 30.0 + 15.0 + 15.0 + 20.0 + 15.0));
}

void DebtScorerTests::testSomaticEmptyStoreCountsMissingSleep()
{
    InMemoryHealthStore store;
    QVERIFY(near(vita::SomaticStressScorer().score(store, 6.0), 30.0));
}

QTEST_MAIN(DebtScorerTests)
#include "test_debt_scorers.moc"
