#include <workflowengine/core/storage/sqlite_store.hpp>
#include <workflowengine/core/storage/store_error.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <mutex>

namespace WorkflowEngine {

namespace {

constexpr const char* kCreateDetectorTable =
    "CREATE TABLE IF NOT EXISTS detector ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    type TEXT NOT NULL,"
    "    workflow_condition_group_id INTEGER"
    ");";

constexpr const char* kCreateConditionGroupTable =
    "CREATE TABLE IF NOT EXISTS data_condition_group ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    logic_type TEXT NOT NULL"
    ");";

constexpr const char* kCreateConditionTable =
    "CREATE TABLE IF NOT EXISTS data_condition ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    condition_group_id INTEGER NOT NULL"
    "        REFERENCES data_condition_group(id) ON DELETE CASCADE,"
    "    type TEXT NOT NULL,"
    "    comparison REAL NOT NULL,"
    "    condition_result INTEGER NOT NULL"
    ");";

constexpr const char* kCreateDetectorStateTable =
    "CREATE TABLE IF NOT EXISTS detector_state ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    detector_id INTEGER NOT NULL,"
    "    detector_group_key TEXT,"
    "    active INTEGER NOT NULL,"
    "    state INTEGER NOT NULL"
    ");";

// NULL never collides under a plain UNIQUE index, so the no-group row gets
// its own partial index
constexpr const char* kCreateDetectorStateIndexes =
    "CREATE UNIQUE INDEX IF NOT EXISTS detector_state_group_key_uniq"
    "    ON detector_state(detector_id, detector_group_key);"
    "CREATE UNIQUE INDEX IF NOT EXISTS detector_state_null_group_key_uniq"
    "    ON detector_state(detector_id) WHERE detector_group_key IS NULL;";

// Stays well below SQLITE_MAX_VARIABLE_NUMBER on older builds
constexpr size_t kMaxKeysPerQuery = 500;

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindInt(int index, int64_t value) { checkBind(sqlite3_bind_int64(stmt_, index, value)); }
    void bindDouble(int index, double value) { checkBind(sqlite3_bind_double(stmt_, index, value)); }
    void bindText(int index, const std::string& value) {
        checkBind(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bindOptionalText(int index, const std::optional<std::string>& value) {
        if (value) {
            bindText(index, *value);
        } else {
            checkBind(sqlite3_bind_null(stmt_, index));
        }
    }
    void bindOptionalInt(int index, const std::optional<int64_t>& value) {
        if (value) {
            bindInt(index, *value);
        } else {
            checkBind(sqlite3_bind_null(stmt_, index));
        }
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t columnInt(int index) const { return sqlite3_column_int64(stmt_, index); }
    double columnDouble(int index) const { return sqlite3_column_double(stmt_, index); }
    std::optional<std::string> columnOptionalText(int index) const {
        if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
            return std::nullopt;
        }
        const unsigned char* text = sqlite3_column_text(stmt_, index);
        return std::string(text ? reinterpret_cast<const char*>(text) : "");
    }
    std::optional<int64_t> columnOptionalInt(int index) const {
        if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
            return std::nullopt;
        }
        return columnInt(index);
    }

private:
    void checkBind(int rc) const {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void execOrThrow(sqlite3* db, const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

// Rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        execOrThrow(db_, "BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!committed_) {
            char* error = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
                spdlog::error("[SqliteStore] Rollback failed: {}", error ? error : "unknown");
                sqlite3_free(error);
            }
        }
    }

    void commit() {
        execOrThrow(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

DetectorState readDetectorState(const Statement& stmt) {
    DetectorState row;
    row.id = stmt.columnInt(0);
    row.detector_id = stmt.columnInt(1);
    row.detector_group_key = stmt.columnOptionalText(2);
    row.active = stmt.columnInt(3) != 0;
    row.state = priorityFromInt(static_cast<int>(stmt.columnInt(4)));
    return row;
}

} // namespace

struct SqliteStore::Impl {
    sqlite3* db = nullptr;
    mutable std::mutex mutex;

    std::mutex listeners_mutex;
    std::vector<ConditionGroupListener> listeners;
};

SqliteStore::SqliteStore(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
    if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
        std::string message = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        spdlog::error("[SqliteStore] Failed to open database at {}: {}", path, message);
        throw StoreError("failed to open database: " + message);
    }

    try {
        execOrThrow(impl_->db, "PRAGMA foreign_keys = ON;");
        execOrThrow(impl_->db, kCreateDetectorTable);
        execOrThrow(impl_->db, kCreateConditionGroupTable);
        execOrThrow(impl_->db, kCreateConditionTable);
        execOrThrow(impl_->db, kCreateDetectorStateTable);
        execOrThrow(impl_->db, kCreateDetectorStateIndexes);
    } catch (const StoreError& e) {
        spdlog::error("[SqliteStore] Schema initialization failed: {}", e.what());
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        throw;
    }

    spdlog::info("[SqliteStore] Opened {}", path);
}

SqliteStore::~SqliteStore() {
    if (impl_ && impl_->db) {
        sqlite3_close(impl_->db);
    }
}

// ============================================================================
// Detectors
// ============================================================================

int64_t SqliteStore::createDetector(const Detector& detector) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    Statement stmt(impl_->db,
        "INSERT INTO detector (name, type, workflow_condition_group_id) VALUES (?, ?, ?);");
    stmt.bindText(1, detector.name);
    stmt.bindText(2, detector.type);
    stmt.bindOptionalInt(3, detector.workflow_condition_group_id);
    stmt.run();
    return sqlite3_last_insert_rowid(impl_->db);
}

std::optional<Detector> SqliteStore::getDetector(int64_t detector_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    Statement stmt(impl_->db,
        "SELECT id, name, type, workflow_condition_group_id FROM detector WHERE id = ?;");
    stmt.bindInt(1, detector_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    Detector detector;
    detector.id = stmt.columnInt(0);
    detector.name = stmt.columnOptionalText(1).value_or("");
    detector.type = stmt.columnOptionalText(2).value_or("");
    detector.workflow_condition_group_id = stmt.columnOptionalInt(3);
    return detector;
}

std::vector<Detector> SqliteStore::listDetectors() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    Statement stmt(impl_->db,
        "SELECT id, name, type, workflow_condition_group_id FROM detector ORDER BY id;");
    std::vector<Detector> detectors;
    while (stmt.step()) {
        Detector detector;
        detector.id = stmt.columnInt(0);
        detector.name = stmt.columnOptionalText(1).value_or("");
        detector.type = stmt.columnOptionalText(2).value_or("");
        detector.workflow_condition_group_id = stmt.columnOptionalInt(3);
        detectors.push_back(std::move(detector));
    }
    return detectors;
}

// ============================================================================
// Condition groups
// ============================================================================

int64_t SqliteStore::createConditionGroup(const DataConditionGroup& group) {
    int64_t group_id = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        Statement stmt(impl_->db, "INSERT INTO data_condition_group (logic_type) VALUES (?);");
        stmt.bindText(1, group.logic_type);
        stmt.run();
        group_id = sqlite3_last_insert_rowid(impl_->db);
    }
    // A cached "missing" entry for a reused id must not outlive the insert
    notifyConditionGroupChanged(group_id);
    return group_id;
}

void SqliteStore::deleteConditionGroup(int64_t group_id) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        Transaction tx(impl_->db);
        Statement conditions(impl_->db, "DELETE FROM data_condition WHERE condition_group_id = ?;");
        conditions.bindInt(1, group_id);
        conditions.run();
        Statement group(impl_->db, "DELETE FROM data_condition_group WHERE id = ?;");
        group.bindInt(1, group_id);
        group.run();
        tx.commit();
    }
    notifyConditionGroupChanged(group_id);
}

int64_t SqliteStore::createCondition(const DataCondition& condition) {
    int64_t condition_id = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        Statement stmt(impl_->db,
            "INSERT INTO data_condition (condition_group_id, type, comparison, condition_result)"
            " VALUES (?, ?, ?, ?);");
        stmt.bindInt(1, condition.condition_group_id);
        stmt.bindText(2, toString(condition.type));
        stmt.bindDouble(3, condition.comparison);
        stmt.bindInt(4, static_cast<int64_t>(condition.condition_result));
        stmt.run();
        condition_id = sqlite3_last_insert_rowid(impl_->db);
    }
    notifyConditionGroupChanged(condition.condition_group_id);
    return condition_id;
}

void SqliteStore::updateCondition(const DataCondition& condition) {
    std::optional<int64_t> previous_group;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        Transaction tx(impl_->db);

        Statement lookup(impl_->db, "SELECT condition_group_id FROM data_condition WHERE id = ?;");
        lookup.bindInt(1, condition.id);
        if (lookup.step()) {
            previous_group = lookup.columnInt(0);
        }
        lookup.reset();

        Statement stmt(impl_->db,
            "UPDATE data_condition SET condition_group_id = ?, type = ?, comparison = ?,"
            " condition_result = ? WHERE id = ?;");
        stmt.bindInt(1, condition.condition_group_id);
        stmt.bindText(2, toString(condition.type));
        stmt.bindDouble(3, condition.comparison);
        stmt.bindInt(4, static_cast<int64_t>(condition.condition_result));
        stmt.bindInt(5, condition.id);
        stmt.run();
        tx.commit();
    }
    // Moving a condition between groups changes both of them
    if (previous_group && *previous_group != condition.condition_group_id) {
        notifyConditionGroupChanged(*previous_group);
    }
    notifyConditionGroupChanged(condition.condition_group_id);
}

void SqliteStore::deleteCondition(int64_t condition_id) {
    std::optional<int64_t> group_id;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        Transaction tx(impl_->db);
        Statement lookup(impl_->db, "SELECT condition_group_id FROM data_condition WHERE id = ?;");
        lookup.bindInt(1, condition_id);
        if (lookup.step()) {
            group_id = lookup.columnInt(0);
        }
        lookup.reset();
        Statement stmt(impl_->db, "DELETE FROM data_condition WHERE id = ?;");
        stmt.bindInt(1, condition_id);
        stmt.run();
        tx.commit();
    }
    if (group_id) {
        notifyConditionGroupChanged(*group_id);
    }
}

void SqliteStore::addConditionGroupListener(ConditionGroupListener listener) {
    std::lock_guard<std::mutex> lock(impl_->listeners_mutex);
    impl_->listeners.push_back(std::move(listener));
}

void SqliteStore::notifyConditionGroupChanged(int64_t group_id) {
    // Called without the connection lock: listeners may read back through
    // fetchConditionGroup()
    std::vector<ConditionGroupListener> listeners;
    {
        std::lock_guard<std::mutex> lock(impl_->listeners_mutex);
        listeners = impl_->listeners;
    }
    for (auto& listener : listeners) {
        listener(group_id);
    }
}

std::optional<ConditionGroupData> SqliteStore::fetchConditionGroup(int64_t group_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    Statement group_stmt(impl_->db, "SELECT id, logic_type FROM data_condition_group WHERE id = ?;");
    group_stmt.bindInt(1, group_id);
    if (!group_stmt.step()) {
        return std::nullopt;
    }

    ConditionGroupData data;
    data.group.id = group_stmt.columnInt(0);
    data.group.logic_type = group_stmt.columnOptionalText(1).value_or("any");

    Statement stmt(impl_->db,
        "SELECT id, condition_group_id, type, comparison, condition_result"
        " FROM data_condition WHERE condition_group_id = ? ORDER BY id;");
    stmt.bindInt(1, group_id);
    while (stmt.step()) {
        DataCondition condition;
        condition.id = stmt.columnInt(0);
        condition.condition_group_id = stmt.columnInt(1);
        auto type_text = stmt.columnOptionalText(2).value_or("");
        auto type = conditionTypeFromString(type_text);
        if (!type) {
            spdlog::warn("[SqliteStore] Skipping condition id={} with unknown type '{}'",
                         condition.id, type_text);
            continue;
        }
        condition.type = *type;
        condition.comparison = stmt.columnDouble(3);
        condition.condition_result = priorityFromInt(static_cast<int>(stmt.columnInt(4)));
        data.conditions.push_back(condition);
    }
    return data;
}

// ============================================================================
// Detector state
// ============================================================================

std::vector<DetectorState> SqliteStore::filterDetectorStates(
    int64_t detector_id, const std::vector<DetectorGroupKey>& group_keys) {
    std::vector<DetectorState> rows;
    if (group_keys.empty()) {
        return rows;
    }

    std::vector<std::string> named_keys;
    bool include_null = false;
    for (const auto& key : group_keys) {
        if (key) {
            named_keys.push_back(*key);
        } else {
            include_null = true;
        }
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    const std::string select =
        "SELECT id, detector_id, detector_group_key, active, state"
        " FROM detector_state WHERE detector_id = ?";

    // The NULL key rides along with the first chunk so a lookup of up to
    // kMaxKeysPerQuery keys is always a single statement
    size_t offset = 0;
    do {
        const size_t count = std::min(kMaxKeysPerQuery, named_keys.size() - offset);
        const bool with_null = include_null && offset == 0;

        std::string sql = select;
        if (count == 0) {
            sql += " AND detector_group_key IS NULL;";
        } else {
            sql += with_null ? " AND (detector_group_key IN (" : " AND detector_group_key IN (";
            for (size_t i = 0; i < count; ++i) {
                sql += (i == 0) ? "?" : ", ?";
            }
            sql += with_null ? ") OR detector_group_key IS NULL);" : ");";
        }

        Statement stmt(impl_->db, sql);
        stmt.bindInt(1, detector_id);
        for (size_t i = 0; i < count; ++i) {
            stmt.bindText(static_cast<int>(i + 2), named_keys[offset + i]);
        }
        while (stmt.step()) {
            rows.push_back(readDetectorState(stmt));
        }
        offset += count;
    } while (offset < named_keys.size());
    return rows;
}

void SqliteStore::bulkCreateDetectorStates(const std::vector<DetectorState>& states) {
    if (states.empty()) return;

    std::lock_guard<std::mutex> lock(impl_->mutex);
    Transaction tx(impl_->db);
    Statement stmt(impl_->db,
        "INSERT INTO detector_state (detector_id, detector_group_key, active, state)"
        " VALUES (?, ?, ?, ?);");
    for (const auto& row : states) {
        stmt.bindInt(1, row.detector_id);
        stmt.bindOptionalText(2, row.detector_group_key);
        stmt.bindInt(3, row.active ? 1 : 0);
        stmt.bindInt(4, static_cast<int64_t>(row.state));
        stmt.run();
        stmt.reset();
    }
    tx.commit();
    spdlog::debug("[SqliteStore] Created {} detector_state rows", states.size());
}

void SqliteStore::bulkUpdateDetectorStates(const std::vector<DetectorState>& states) {
    if (states.empty()) return;

    std::lock_guard<std::mutex> lock(impl_->mutex);
    Transaction tx(impl_->db);
    Statement stmt(impl_->db, "UPDATE detector_state SET active = ?, state = ? WHERE id = ?;");
    for (const auto& row : states) {
        stmt.bindInt(1, row.active ? 1 : 0);
        stmt.bindInt(2, static_cast<int64_t>(row.state));
        stmt.bindInt(3, row.id);
        stmt.run();
        stmt.reset();
    }
    tx.commit();
    spdlog::debug("[SqliteStore] Updated {} detector_state rows", states.size());
}

size_t SqliteStore::countDetectorStates() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    Statement stmt(impl_->db, "SELECT COUNT(*) FROM detector_state;");
    return stmt.step() ? static_cast<size_t>(stmt.columnInt(0)) : 0;
}

} // namespace WorkflowEngine
