#include "include/task_store.hpp"
#include "include/errors.hpp"
#include <iostream>

namespace courier {

namespace {

const char* kTaskColumns =
    "id, description, mode, priority, status, created_at, created_by, "
    "started_at, completed_at, result, error, progress, progress_message, "
    "metadata, cancel_requested";

const char* kPriorityOrder =
    "CASE priority WHEN 'urgent' THEN 0 WHEN 'high' THEN 1 "
    "WHEN 'normal' THEN 2 WHEN 'low' THEN 3 ELSE 4 END";

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = std::string("prepare failed: ") + sqlite3_errmsg(db_) + " sql=" + sql;
            sqlite3_finalize(stmt_);
            throw StoreError(msg);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    void bind(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }
    void bind(int idx, const std::optional<std::string>& value) {
        if (value) bind(idx, *value);
        else check(sqlite3_bind_null(stmt_, idx));
    }
    void bind(int idx, double value) { check(sqlite3_bind_double(stmt_, idx, value)); }
    void bind(int idx, int64_t value) { check(sqlite3_bind_int64(stmt_, idx, value)); }

    // Metadata goes in as JSON text; pair with json(?) in the SQL.
    void bind(int idx, const Metadata& md) { bind(idx, dump_metadata(md)); }

    // SQLITE_ROW or SQLITE_DONE; anything else throws.
    int step() {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
        }
        return rc;
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), done_(false) { run("BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (done_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[TaskStore] ROLLBACK_FAILED err=" << (err ? err : "unknown") << "\n";
        }
        sqlite3_free(err);
    }
    void commit() {
        run("COMMIT");
        done_ = true;
    }

private:
    void run(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string(sql) + " failed: " + (err ? err : "unknown");
            sqlite3_free(err);
            throw StoreError(msg);
        }
    }

    sqlite3* db_;
    bool done_;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

std::optional<Timestamp> column_timestamp(sqlite3_stmt* stmt, int col) {
    auto text = column_optional_text(stmt, col);
    if (!text) return std::nullopt;
    return parse_timestamp(*text);
}

// NULL or empty reads as {}. Anything that is not a JSON object is a
// corrupt row.
Metadata decode_metadata(const char* text) {
    if (!text || !*text) return Metadata::object();
    Metadata out = Metadata::parse(text, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        throw StoreError(std::string("malformed metadata json: ") + text);
    }
    return out;
}

} // namespace

TaskStore::TaskStore() : db_(nullptr) {}

TaskStore::~TaskStore() {
    close();
}

void TaskStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = "open '" + db_path + "' failed: " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(msg);
    }
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA busy_timeout=5000");
    ensure_schema();
    std::cout << "[TaskStore] OPENED path=" << db_path << "\n";
}

void TaskStore::close() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool TaskStore::is_open() const {
    return db_ != nullptr;
}

void TaskStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = "exec failed: " + std::string(err ? err : "unknown") + " sql=" + sql;
        sqlite3_free(err);
        throw StoreError(msg);
    }
}

void TaskStore::throw_db_error(const std::string& what) {
    throw StoreError(what + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open"));
}

void TaskStore::ensure_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS tasks ("
        "  id TEXT PRIMARY KEY,"
        "  description TEXT NOT NULL,"
        "  mode TEXT NOT NULL,"
        "  priority TEXT NOT NULL DEFAULT 'normal',"
        "  status TEXT NOT NULL DEFAULT 'pending',"
        "  created_at TEXT NOT NULL,"
        "  created_by TEXT NOT NULL,"
        "  started_at TEXT,"
        "  completed_at TEXT,"
        "  result TEXT,"
        "  error TEXT,"
        "  progress REAL,"
        "  progress_message TEXT,"
        "  metadata TEXT,"
        "  cancel_requested INTEGER NOT NULL DEFAULT 0"
        ")");
    exec(
        "CREATE TABLE IF NOT EXISTS task_events ("
        "  id TEXT PRIMARY KEY,"
        "  task_id TEXT NOT NULL,"
        "  event_type TEXT NOT NULL,"
        "  timestamp TEXT NOT NULL,"
        "  data TEXT,"
        "  FOREIGN KEY (task_id) REFERENCES tasks(id)"
        ")");
    exec("CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status)");
    exec("CREATE INDEX IF NOT EXISTS idx_tasks_priority ON tasks(priority)");
    exec("CREATE INDEX IF NOT EXISTS idx_task_events_task_id ON task_events(task_id)");
}

void TaskStore::append_event(const std::string& task_id, TaskEventType type, const Metadata& data) {
    Statement st(db_,
        "INSERT INTO task_events (id, task_id, event_type, timestamp, data) "
        "VALUES (?, ?, ?, ?, json(?))");
    st.bind(1, generate_uuid());
    st.bind(2, task_id);
    st.bind(3, std::string(to_string(type)));
    st.bind(4, format_timestamp(Clock::now()));
    st.bind(5, data);
    st.step();
}

Task TaskStore::read_task(sqlite3_stmt* stmt) {
    Task t;
    t.id = column_text(stmt, 0);
    t.description = column_text(stmt, 1);

    auto mode = parse_task_mode(column_text(stmt, 2));
    auto priority = parse_task_priority(column_text(stmt, 3));
    auto status = parse_task_status(column_text(stmt, 4));
    auto created = parse_timestamp(column_text(stmt, 5));
    if (!mode || !priority || !status || !created) {
        throw StoreError("malformed task row id=" + t.id);
    }
    t.mode = *mode;
    t.priority = *priority;
    t.status = *status;
    t.created_at = *created;
    t.created_by = column_text(stmt, 6);
    t.started_at = column_timestamp(stmt, 7);
    t.completed_at = column_timestamp(stmt, 8);
    t.result = column_optional_text(stmt, 9);
    t.error = column_optional_text(stmt, 10);
    if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) t.progress = sqlite3_column_double(stmt, 11);
    t.progress_message = column_optional_text(stmt, 12);
    t.metadata = decode_metadata(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 13)));
    t.cancel_requested = sqlite3_column_int(stmt, 14) != 0;
    return t;
}

void TaskStore::insert_task(const Task& task, const Metadata& event_data) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("insert_task");
    Transaction txn(db_);
    Statement st(db_,
        "INSERT INTO tasks (id, description, mode, priority, status, created_at, created_by, metadata) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, json(?))");
    st.bind(1, task.id);
    st.bind(2, task.description);
    st.bind(3, std::string(to_string(task.mode)));
    st.bind(4, std::string(to_string(task.priority)));
    st.bind(5, std::string(to_string(task.status)));
    st.bind(6, format_timestamp(task.created_at));
    st.bind(7, task.created_by);
    st.bind(8, task.metadata);
    st.step();
    append_event(task.id, TaskEventType::Created, event_data);
    txn.commit();
}

std::optional<Task> TaskStore::get_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("get_task");
    Statement st(db_, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id = ?");
    st.bind(1, task_id);
    if (st.step() == SQLITE_ROW) return read_task(st.get());
    return std::nullopt;
}

std::vector<Task> TaskStore::list_tasks(std::optional<TaskStatus> status, int limit) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("list_tasks");
    std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks ";
    if (status) sql += "WHERE status = ? ";
    sql += "ORDER BY created_at DESC, rowid DESC LIMIT ?";

    Statement st(db_, sql);
    int idx = 1;
    if (status) st.bind(idx++, std::string(to_string(*status)));
    st.bind(idx, static_cast<int64_t>(limit));

    std::vector<Task> out;
    while (st.step() == SQLITE_ROW) out.push_back(read_task(st.get()));
    return out;
}

std::optional<Task> TaskStore::next_pending() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("next_pending");
    Statement st(db_, std::string("SELECT ") + kTaskColumns +
        " FROM tasks WHERE status = 'pending' ORDER BY " + kPriorityOrder +
        ", created_at ASC, rowid ASC LIMIT 1");
    if (st.step() == SQLITE_ROW) return read_task(st.get());
    return std::nullopt;
}

bool TaskStore::claim(const std::string& task_id, Timestamp now) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("claim");
    Transaction txn(db_);
    Statement st(db_,
        "UPDATE tasks SET status = 'running', started_at = ? "
        "WHERE id = ? AND status = 'pending'");
    st.bind(1, format_timestamp(now));
    st.bind(2, task_id);
    st.step();
    if (sqlite3_changes(db_) == 0) return false;
    append_event(task_id, TaskEventType::Started, {});
    txn.commit();
    return true;
}

bool TaskStore::finish(const std::string& task_id, TaskStatus to, Timestamp now,
                       const std::optional<std::string>& result,
                       const std::optional<std::string>& error,
                       const Metadata& event_data) {
    TaskEventType type;
    switch (to) {
    case TaskStatus::Completed: type = TaskEventType::Completed; break;
    case TaskStatus::Failed: type = TaskEventType::Failed; break;
    case TaskStatus::Cancelled: type = TaskEventType::Cancelled; break;
    default:
        return false;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("finish");
    Transaction txn(db_);
    std::string sql = "UPDATE tasks SET status = ?, completed_at = ?, "
                      "result = COALESCE(?, result), error = COALESCE(?, error)";
    if (to == TaskStatus::Completed) sql += ", progress = 1.0";
    sql += " WHERE id = ? AND status = 'running'";

    Statement st(db_, sql);
    st.bind(1, std::string(to_string(to)));
    st.bind(2, format_timestamp(now));
    st.bind(3, result);
    st.bind(4, error);
    st.bind(5, task_id);
    st.step();
    if (sqlite3_changes(db_) == 0) return false;
    append_event(task_id, type, event_data);
    txn.commit();
    return true;
}

bool TaskStore::cancel_pending(const std::string& task_id, Timestamp now, const Metadata& event_data) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("cancel_pending");
    Transaction txn(db_);
    Statement st(db_,
        "UPDATE tasks SET status = 'cancelled', completed_at = ? "
        "WHERE id = ? AND status = 'pending'");
    st.bind(1, format_timestamp(now));
    st.bind(2, task_id);
    st.step();
    if (sqlite3_changes(db_) == 0) return false;
    append_event(task_id, TaskEventType::Cancelled, event_data);
    txn.commit();
    return true;
}

bool TaskStore::request_cancel(const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("request_cancel");
    Transaction txn(db_);
    // Flag column and metadata mirror change in one statement, guarded by status.
    Statement st(db_,
        "UPDATE tasks SET cancel_requested = 1, "
        "metadata = json_set(COALESCE(metadata, '{}'), '$.cancel_requested', json('true')) "
        "WHERE id = ? AND status = 'running'");
    st.bind(1, task_id);
    st.step();
    if (sqlite3_changes(db_) == 0) return false;
    append_event(task_id, TaskEventType::CancelRequested, {});
    txn.commit();
    return true;
}

bool TaskStore::update_progress(const std::string& task_id, double progress,
                                const std::optional<std::string>& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("update_progress");
    Transaction txn(db_);
    Statement st(db_, "UPDATE tasks SET progress = ?, progress_message = ? WHERE id = ?");
    st.bind(1, progress);
    st.bind(2, message);
    st.bind(3, task_id);
    st.step();
    if (sqlite3_changes(db_) == 0) return false;

    Metadata data = Metadata::object();
    data["progress"] = progress;
    if (message) data["message"] = *message;
    append_event(task_id, TaskEventType::Progress, data);
    txn.commit();
    return true;
}

bool TaskStore::is_cancel_requested(const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("is_cancel_requested");
    Statement st(db_, "SELECT cancel_requested FROM tasks WHERE id = ?");
    st.bind(1, task_id);
    if (st.step() == SQLITE_ROW) return sqlite3_column_int(st.get(), 0) != 0;
    return false;
}

std::vector<TaskEvent> TaskStore::events(const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("events");
    Statement st(db_,
        "SELECT id, task_id, event_type, timestamp, data FROM task_events "
        "WHERE task_id = ? ORDER BY rowid ASC");
    st.bind(1, task_id);

    std::vector<TaskEvent> out;
    while (st.step() == SQLITE_ROW) {
        TaskEvent ev;
        ev.id = column_text(st.get(), 0);
        ev.task_id = column_text(st.get(), 1);
        auto type = parse_task_event_type(column_text(st.get(), 2));
        auto ts = parse_timestamp(column_text(st.get(), 3));
        if (!type || !ts) throw StoreError("malformed event row id=" + ev.id);
        ev.event_type = *type;
        ev.timestamp = *ts;
        ev.data = decode_metadata(reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 4)));
        out.push_back(std::move(ev));
    }
    return out;
}

std::map<TaskStatus, int64_t> TaskStore::count_by_status() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw_db_error("count_by_status");
    std::map<TaskStatus, int64_t> out = {
        {TaskStatus::Pending, 0}, {TaskStatus::Running, 0}, {TaskStatus::Completed, 0},
        {TaskStatus::Failed, 0}, {TaskStatus::Cancelled, 0},
    };
    Statement st(db_, "SELECT status, COUNT(*) FROM tasks GROUP BY status");
    while (st.step() == SQLITE_ROW) {
        auto status = parse_task_status(column_text(st.get(), 0));
        if (status) out[*status] = sqlite3_column_int64(st.get(), 1);
    }
    return out;
}

} // namespace courier
