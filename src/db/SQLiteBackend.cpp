#include "db/SQLiteBackend.hpp"
#include <plog/Log.h>

namespace CadPreview {

namespace {

// Owns the statement; result sets borrow it and reset it when done.
class SQLiteStatement : public IStatement {
public:
    SQLiteStatement(sqlite3* db_, sqlite3_stmt* s_) : db(db_), stmt(s_) {}
    ~SQLiteStatement() override { if(stmt) sqlite3_finalize(stmt); }

    void bindText(int idx, const std::string &s) override {
        if(sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
            PLOGW << "SQLiteBackend: bind " << idx << " failed: " << sqlite3_errmsg(db);
    }

    std::unique_ptr<IResultSet> query() override;

private:
    sqlite3* db;
    sqlite3_stmt* stmt;
};

class SQLiteRows : public IResultSet {
public:
    SQLiteRows(sqlite3* db_, sqlite3_stmt* s_) : db(db_), stmt(s_) {}
    ~SQLiteRows() override { sqlite3_reset(stmt); }

    bool next() override {
        int r = sqlite3_step(stmt);
        if(r == SQLITE_ROW) return true;
        if(r != SQLITE_DONE) PLOGW << "SQLiteBackend: step failed: " << sqlite3_errmsg(db);
        return false;
    }
    int columnCount() const override { return sqlite3_column_count(stmt); }
    std::string columnName(int idx) const override {
        const char* n = sqlite3_column_name(stmt, idx);
        return n ? n : std::string();
    }
    std::optional<std::string> text(int idx) override {
        if(sqlite3_column_type(stmt, idx) == SQLITE_NULL) return std::nullopt;
        const unsigned char* t = sqlite3_column_text(stmt, idx);
        return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
    }

private:
    sqlite3* db;
    sqlite3_stmt* stmt;
};

std::unique_ptr<IResultSet> SQLiteStatement::query(){ return std::make_unique<SQLiteRows>(db, stmt); }

std::string quoteIdentifier(const std::string& name){
    std::string out = "\"";
    for(char c : name){
        if(c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

} // namespace

SQLiteBackend::~SQLiteBackend(){ close(); }

bool SQLiteBackend::open(const DBConnectionInfo &info, std::string *outError){
    if(db) close();
    if(info.path.empty()){
        if(outError) *outError = "no database path";
        return false;
    }
    int flags = info.readOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if(sqlite3_open_v2(info.path.c_str(), &db, flags, nullptr) != SQLITE_OK){
        if(outError) *outError = db ? sqlite3_errmsg(db) : "sqlite3_open_v2 failed";
        if(db){ sqlite3_close(db); db = nullptr; }
        return false;
    }
    if(info.busyTimeoutMs > 0) sqlite3_busy_timeout(db, info.busyTimeoutMs);
    path_ = info.path;
    PLOGI << "SQLiteBackend: opened " << path_ << (info.readOnly ? " (read-only)" : "");
    return true;
}

void SQLiteBackend::close(){
    if(!db) return;
    sqlite3_close(db);
    db = nullptr;
    PLOGD << "SQLiteBackend: closed " << path_;
}

bool SQLiteBackend::execute(const std::string &sql, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return false; }
    char* err = nullptr;
    if(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK){
        if(outError) *outError = err ? err : sqlite3_errmsg(db);
        if(err) sqlite3_free(err);
        return false;
    }
    return true;
}

std::unique_ptr<IStatement> SQLiteBackend::prepare(const std::string &sql, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return nullptr; }
    sqlite3_stmt* stmt = nullptr;
    if(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK){
        if(outError) *outError = sqlite3_errmsg(db);
        if(stmt) sqlite3_finalize(stmt);
        return nullptr;
    }
    return std::make_unique<SQLiteStatement>(db, stmt);
}

bool SQLiteBackend::hasTable(const std::string &table){
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type IN ('table','view') AND name = ?;");
    if(!stmt) return false;
    stmt->bindText(1, table);
    auto rows = stmt->query();
    return rows->next();
}

std::vector<std::string> SQLiteBackend::columnsOf(const std::string &table){
    std::vector<std::string> out;
    auto stmt = prepare("PRAGMA table_info(" + quoteIdentifier(table) + ");");
    if(!stmt) return out;
    auto rows = stmt->query();
    while(rows->next()){
        auto name = rows->text(1);
        if(name) out.push_back(*name);
    }
    return out;
}

} // namespace CadPreview
