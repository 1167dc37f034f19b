#include "store/sqlite_health_store.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <string>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace vita {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char *kCreateGlucoseTable =
    "CREATE TABLE IF NOT EXISTS glucose_readings ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    glucose_mg_dl REAL NOT NULL,"
    "    trend TEXT NOT NULL,"
    "    energy_state TEXT NOT NULL,"
    "    related_meal_id INTEGER"
    ");";

constexpr const char *kCreateMealsTable =
    "CREATE TABLE IF NOT EXISTS meal_events ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    source TEXT,"
    "    ingredients TEXT,"
    "    cooking_method TEXT,"
    "    estimated_gl REAL,"
    "    bioavailability REAL"
    ");";

constexpr const char *kCreateBehaviorsTable =
    "CREATE TABLE IF NOT EXISTS behavioral_events ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    duration_seconds REAL NOT NULL,"
    "    category TEXT NOT NULL,"
    "    app_name TEXT,"
    "    dopamine_debt REAL"
    ");";

constexpr const char *kCreateEnvironmentTable =
    "CREATE TABLE IF NOT EXISTS environmental_conditions ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    temperature_c REAL NOT NULL,"
    "    humidity REAL NOT NULL,"
    "    aqi_us INTEGER NOT NULL,"
    "    uv_index REAL NOT NULL,"
    "    pollen_index INTEGER NOT NULL"
    ");";

constexpr const char *kCreateSamplesTable =
    "CREATE TABLE IF NOT EXISTS physiological_samples ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    metric_type TEXT NOT NULL,"
    "    value REAL NOT NULL,"
    "    unit TEXT,"
    "    timestamp INTEGER NOT NULL"
    ");";

constexpr const char *kCreateEdgesTable =
    "CREATE TABLE IF NOT EXISTS causal_edges ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    source_node_id TEXT NOT NULL,"
    "    target_node_id TEXT NOT NULL,"
    "    source_type TEXT,"
    "    target_type TEXT,"
    "    edge_type TEXT NOT NULL,"
    "    causal_strength REAL NOT NULL,"
    "    temporal_offset REAL NOT NULL,"
    "    confidence REAL NOT NULL,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateEdgeSourceIndex =
    "CREATE INDEX IF NOT EXISTS idx_edges_source ON causal_edges (source_node_id);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw DataUnavailableError(std::string("sqlite prepare failed: ")
                                       + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    // Advances to the next row; false once the result set is exhausted.
    bool nextRow()
    {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw DataUnavailableError(std::string("sqlite step failed: ")
                                       + sqlite3_errmsg(sqlite3_db_handle(stmt)));
        }
        return false;
    }

    void execute(const char *what)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            throw DataUnavailableError(std::string("failed to ") + what + ": "
                                       + sqlite3_errmsg(sqlite3_db_handle(stmt)));
        }
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw DataUnavailableError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_double(stmt, index, *value);
}

void bindRange(sqlite3_stmt *stmt,
               std::chrono::system_clock::time_point from,
               std::chrono::system_clock::time_point to)
{
    sqlite3_bind_int64(stmt, 1, toEpochSeconds(from));
    sqlite3_bind_int64(stmt, 2, toEpochSeconds(to));
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json::array();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json::array();
    }
}

CausalEdge edgeFromRow(sqlite3_stmt *stmt)
{
    CausalEdge edge;
    edge.id = sqlite3_column_int64(stmt, 0);
    edge.sourceNodeId = columnText(stmt, 1);
    edge.targetNodeId = columnText(stmt, 2);
    edge.sourceType = parseNodeTypeString(columnText(stmt, 3));
    edge.targetType = parseNodeTypeString(columnText(stmt, 4));
    edge.edgeType = parseEdgeTypeString(columnText(stmt, 5));
    edge.causalStrength = sqlite3_column_double(stmt, 6);
    edge.temporalOffsetSeconds = sqlite3_column_double(stmt, 7);
    edge.confidence = sqlite3_column_double(stmt, 8);
    edge.createdAt = fromEpochSeconds(sqlite3_column_int64(stmt, 9));
    return edge;
}

constexpr const char *kEdgeColumns =
    "SELECT id, source_node_id, target_node_id, source_type, target_type, "
    "edge_type, causal_strength, temporal_offset, confidence, created_at "
    "FROM causal_edges ";

} // namespace

struct SqliteHealthStore::Impl {
    sqlite3 *db = nullptr;
};

std::filesystem::path SqliteHealthStore::defaultDatabasePath()
{
    const char *overridePath = std::getenv("VITA_DB_PATH");
    if (overridePath && *overridePath) {
        return std::filesystem::path(overridePath);
    }
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/vita";
    return basePath / "vita.db";
}

SqliteHealthStore::SqliteHealthStore()
    : SqliteHealthStore(defaultDatabasePath())
{
}

SqliteHealthStore::SqliteHealthStore(const std::filesystem::path &dbPath)
    : impl(std::make_unique<Impl>())
{
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
    }

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw DataUnavailableError("failed to open vita database: " + message);
    }

    execOrThrow(impl->db, kCreateGlucoseTable);
    execOrThrow(impl->db, kCreateMealsTable);
    execOrThrow(impl->db, kCreateBehaviorsTable);
    execOrThrow(impl->db, kCreateEnvironmentTable);
    execOrThrow(impl->db, kCreateSamplesTable);
    execOrThrow(impl->db, kCreateEdgesTable);
    execOrThrow(impl->db, kCreateEdgeSourceIndex);
    execOrThrow(impl->db, kCreateMetaTable);

    if (!getMeta("schema_version")) {
        setMeta("schema_version", std::to_string(kSchemaVersion));
    }
}

SqliteHealthStore::~SqliteHealthStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::vector<GlucoseReading> SqliteHealthStore::queryGlucose(
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT id, timestamp, glucose_mg_dl, trend, energy_state, "
                   "related_meal_id FROM glucose_readings "
                   "WHERE timestamp >= ? AND timestamp <= ? "
                   "ORDER BY timestamp ASC, id ASC;");
    bindRange(stmt.get(), from, to);

    std::vector<GlucoseReading> readings;
    while (stmt.nextRow()) {
        GlucoseReading reading;
        reading.id = sqlite3_column_int64(stmt.get(), 0);
        reading.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        reading.glucoseMgDL = sqlite3_column_double(stmt.get(), 2);
        reading.trend = parseGlucoseTrendString(columnText(stmt.get(), 3));
        reading.energyState = parseEnergyStateString(columnText(stmt.get(), 4));
        if (sqlite3_column_type(stmt.get(), 5) != SQLITE_NULL) {
            reading.relatedMealEventId = sqlite3_column_int64(stmt.get(), 5);
        }
        readings.push_back(std::move(reading));
    }
    return readings;
}

std::vector<MealEvent> SqliteHealthStore::queryMeals(
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT id, timestamp, source, ingredients, cooking_method, "
                   "estimated_gl, bioavailability FROM meal_events "
                   "WHERE timestamp >= ? AND timestamp <= ? "
                   "ORDER BY timestamp ASC, id ASC;");
    bindRange(stmt.get(), from, to);

    std::vector<MealEvent> meals;
    while (stmt.nextRow()) {
        MealEvent meal;
        meal.id = sqlite3_column_int64(stmt.get(), 0);
        meal.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        meal.source = columnText(stmt.get(), 2);
        const nlohmann::json ingredients = columnJson(stmt.get(), 3);
        if (ingredients.is_array()) {
            meal.ingredients = ingredients.get<std::vector<Ingredient>>();
        }
        meal.cookingMethod = columnText(stmt.get(), 4);
        meal.estimatedGlycemicLoad = columnOptionalDouble(stmt.get(), 5);
        meal.bioavailabilityModifier = columnOptionalDouble(stmt.get(), 6);
        meals.push_back(std::move(meal));
    }
    return meals;
}

std::vector<BehavioralEvent> SqliteHealthStore::queryBehaviors(
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT id, timestamp, duration_seconds, category, app_name, "
                   "dopamine_debt FROM behavioral_events "
                   "WHERE timestamp >= ? AND timestamp <= ? "
                   "ORDER BY timestamp ASC, id ASC;");
    bindRange(stmt.get(), from, to);

    std::vector<BehavioralEvent> events;
    while (stmt.nextRow()) {
        BehavioralEvent event;
        event.id = sqlite3_column_int64(stmt.get(), 0);
        event.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        event.durationSeconds = sqlite3_column_double(stmt.get(), 2);
        event.category = parseBehaviorCategoryString(columnText(stmt.get(), 3));
        event.appName = columnText(stmt.get(), 4);
        event.dopamineDebtScore = columnOptionalDouble(stmt.get(), 5);
        events.push_back(std::move(event));
    }
    return events;
}

std::vector<EnvironmentalCondition> SqliteHealthStore::queryEnvironment(
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT id, timestamp, temperature_c, humidity, aqi_us, "
                   "uv_index, pollen_index FROM environmental_conditions "
                   "WHERE timestamp >= ? AND timestamp <= ? "
                   "ORDER BY timestamp ASC, id ASC;");
    bindRange(stmt.get(), from, to);

    std::vector<EnvironmentalCondition> conditions;
    while (stmt.nextRow()) {
        EnvironmentalCondition condition;
        condition.id = sqlite3_column_int64(stmt.get(), 0);
        condition.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        condition.temperatureCelsius = sqlite3_column_double(stmt.get(), 2);
        condition.humidity = sqlite3_column_double(stmt.get(), 3);
        condition.aqiUS = sqlite3_column_int(stmt.get(), 4);
        condition.uvIndex = sqlite3_column_double(stmt.get(), 5);
        condition.pollenIndex = sqlite3_column_int(stmt.get(), 6);
        conditions.push_back(condition);
    }
    return conditions;
}

std::vector<PhysiologicalSample> SqliteHealthStore::querySamples(
    MetricType type,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT id, metric_type, value, unit, timestamp "
                   "FROM physiological_samples "
                   "WHERE timestamp >= ? AND timestamp <= ? AND metric_type = ? "
                   "ORDER BY timestamp ASC, id ASC;");
    bindRange(stmt.get(), from, to);
    bindText(stmt.get(), 3, toMetricTypeString(type));

    std::vector<PhysiologicalSample> samples;
    while (stmt.nextRow()) {
        PhysiologicalSample sample;
        sample.id = sqlite3_column_int64(stmt.get(), 0);
        sample.metricType = type;
        sample.value = sqlite3_column_double(stmt.get(), 2);
        sample.unit = columnText(stmt.get(), 3);
        sample.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 4));
        samples.push_back(std::move(sample));
    }
    return samples;
}

std::vector<CausalEdge> SqliteHealthStore::queryEdges(const std::string &fromNodeId) const
{
    const std::string sql = std::string(kEdgeColumns)
        + "WHERE source_node_id = ? ORDER BY id ASC;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, fromNodeId);

    std::vector<CausalEdge> edges;
    while (stmt.nextRow()) {
        edges.push_back(edgeFromRow(stmt.get()));
    }
    return edges;
}

std::vector<CausalEdge> SqliteHealthStore::queryEdges(
    EdgeType type,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    const std::string sql = std::string(kEdgeColumns)
        + "WHERE created_at >= ? AND created_at <= ? AND edge_type = ? "
          "ORDER BY id ASC;";
    Statement stmt(impl->db, sql.c_str());
    bindRange(stmt.get(), from, to);
    bindText(stmt.get(), 3, toEdgeTypeString(type));

    std::vector<CausalEdge> edges;
    while (stmt.nextRow()) {
        edges.push_back(edgeFromRow(stmt.get()));
    }
    return edges;
}

std::vector<CausalEdge> SqliteHealthStore::listEdges() const
{
    const std::string sql = std::string(kEdgeColumns) + "ORDER BY id ASC;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<CausalEdge> edges;
    while (stmt.nextRow()) {
        edges.push_back(edgeFromRow(stmt.get()));
    }
    return edges;
}

void SqliteHealthStore::addEdge(CausalEdge &edge)
{
    edge.causalStrength = clampUnit(edge.causalStrength);
    edge.confidence = clampUnit(edge.confidence);
    if (edge.createdAt == std::chrono::system_clock::time_point{}) {
        edge.createdAt = std::chrono::system_clock::now();
    }

    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO causal_edges (id, source_node_id, "
                   "target_node_id, source_type, target_type, edge_type, "
                   "causal_strength, temporal_offset, confidence, created_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (edge.id) {
        sqlite3_bind_int64(stmt.get(), 1, *edge.id);
    } else {
        sqlite3_bind_null(stmt.get(), 1);
    }
    bindText(stmt.get(), 2, edge.sourceNodeId);
    bindText(stmt.get(), 3, edge.targetNodeId);
    bindOptionalText(stmt.get(), 4, edge.sourceType ? toNodeTypeString(*edge.sourceType) : std::string());
    bindOptionalText(stmt.get(), 5, edge.targetType ? toNodeTypeString(*edge.targetType) : std::string());
    bindText(stmt.get(), 6, toEdgeTypeString(edge.edgeType));
    sqlite3_bind_double(stmt.get(), 7, edge.causalStrength);
    sqlite3_bind_double(stmt.get(), 8, edge.temporalOffsetSeconds);
    sqlite3_bind_double(stmt.get(), 9, edge.confidence);
    sqlite3_bind_int64(stmt.get(), 10, toEpochSeconds(edge.createdAt));
    stmt.execute("write causal edge");

    if (!edge.id) {
        edge.id = sqlite3_last_insert_rowid(impl->db);
    }
}

void SqliteHealthStore::addGlucoseReading(GlucoseReading &reading)
{
    Statement stmt(impl->db,
                   "INSERT INTO glucose_readings (timestamp, glucose_mg_dl, trend, "
                   "energy_state, related_meal_id) VALUES (?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(reading.timestamp));
    sqlite3_bind_double(stmt.get(), 2, reading.glucoseMgDL);
    bindText(stmt.get(), 3, toGlucoseTrendString(reading.trend));
    bindText(stmt.get(), 4, toEnergyStateString(reading.energyState));
    if (reading.relatedMealEventId) {
        sqlite3_bind_int64(stmt.get(), 5, *reading.relatedMealEventId);
    } else {
        sqlite3_bind_null(stmt.get(), 5);
    }
    stmt.execute("insert glucose reading");
    reading.id = sqlite3_last_insert_rowid(impl->db);
}

void SqliteHealthStore::addMeal(MealEvent &meal)
{
    Statement stmt(impl->db,
                   "INSERT INTO meal_events (timestamp, source, ingredients, "
                   "cooking_method, estimated_gl, bioavailability) "
                   "VALUES (?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(meal.timestamp));
    bindOptionalText(stmt.get(), 2, meal.source);
    bindText(stmt.get(), 3,
             nlohmann::json(meal.ingredients).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    bindOptionalText(stmt.get(), 4, meal.cookingMethod);
    bindOptionalDouble(stmt.get(), 5, meal.estimatedGlycemicLoad);
    bindOptionalDouble(stmt.get(), 6, meal.bioavailabilityModifier);
    stmt.execute("insert meal event");
    meal.id = sqlite3_last_insert_rowid(impl->db);
}

void SqliteHealthStore::addBehavior(BehavioralEvent &event)
{
    Statement stmt(impl->db,
                   "INSERT INTO behavioral_events (timestamp, duration_seconds, "
                   "category, app_name, dopamine_debt) VALUES (?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(event.timestamp));
    sqlite3_bind_double(stmt.get(), 2, event.durationSeconds);
    bindText(stmt.get(), 3, toBehaviorCategoryString(event.category));
    bindOptionalText(stmt.get(), 4, event.appName);
    bindOptionalDouble(stmt.get(), 5, event.dopamineDebtScore);
    stmt.execute("insert behavioral event");
    event.id = sqlite3_last_insert_rowid(impl->db);
}

void SqliteHealthStore::addEnvironment(EnvironmentalCondition &condition)
{
    Statement stmt(impl->db,
                   "INSERT INTO environmental_conditions (timestamp, temperature_c, "
                   "humidity, aqi_us, uv_index, pollen_index) "
                   "VALUES (?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(condition.timestamp));
    sqlite3_bind_double(stmt.get(), 2, condition.temperatureCelsius);
    sqlite3_bind_double(stmt.get(), 3, condition.humidity);
    sqlite3_bind_int(stmt.get(), 4, condition.aqiUS);
    sqlite3_bind_double(stmt.get(), 5, condition.uvIndex);
    sqlite3_bind_int(stmt.get(), 6, condition.pollenIndex);
    stmt.execute("insert environmental condition");
    condition.id = sqlite3_last_insert_rowid(impl->db);
}

void SqliteHealthStore::addSample(PhysiologicalSample &sample)
{
    Statement stmt(impl->db,
                   "INSERT INTO physiological_samples (metric_type, value, unit, "
                   "timestamp) VALUES (?, ?, ?, ?);");
    bindText(stmt.get(), 1, toMetricTypeString(sample.metricType));
    sqlite3_bind_double(stmt.get(), 2, sample.value);
    bindOptionalText(stmt.get(), 3, sample.unit);
    sqlite3_bind_int64(stmt.get(), 4, toEpochSeconds(sample.timestamp));
    stmt.execute("insert physiological sample");
    sample.id = sqlite3_last_insert_rowid(impl->db);
}

std::optional<std::string> SqliteHealthStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (!stmt.nextRow()) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void SqliteHealthStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.execute("set meta value");
}

} // namespace vita
