#pragma once

#include <filesystem>
#include <memory>

#include "store/health_store.hpp"

namespace vita {

// SQLite-backed health graph. The default location is
// $HOME/.local/share/vita/vita.db; VITA_DB_PATH overrides it.
class SqliteHealthStore : public HealthDataStore {
public:
    SqliteHealthStore();
    explicit SqliteHealthStore(const std::filesystem::path &dbPath);
    ~SqliteHealthStore() override;

    static std::filesystem::path defaultDatabasePath();

    std::vector<GlucoseReading> queryGlucose(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::vector<MealEvent> queryMeals(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::vector<BehavioralEvent> queryBehaviors(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::vector<EnvironmentalCondition> queryEnvironment(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::vector<PhysiologicalSample> querySamples(
        MetricType type,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;

    std::vector<CausalEdge> queryEdges(const std::string &fromNodeId) const override;
    std::vector<CausalEdge> queryEdges(
        EdgeType type,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::vector<CausalEdge> listEdges() const override;
    void addEdge(CausalEdge &edge) override;

    void addGlucoseReading(GlucoseReading &reading) override;
    void addMeal(MealEvent &meal) override;
    void addBehavior(BehavioralEvent &event) override;
    void addEnvironment(EnvironmentalCondition &condition) override;
    void addSample(PhysiologicalSample &sample) override;

    std::optional<std::string> getMeta(const std::string &key) const override;
    void setMeta(const std::string &key, const std::string &value) override;

    using HealthDataStore::queryBehaviors;
    using HealthDataStore::queryEnvironment;
    using HealthDataStore::queryGlucose;
    using HealthDataStore::queryMeals;
    using HealthDataStore::querySamples;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace vita
