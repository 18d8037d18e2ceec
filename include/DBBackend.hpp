#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>

// Read access to the marketplace database: quotes, files and uploads rows.
namespace CadPreview {

struct DBConnectionInfo {
    std::string path;       // database file, or ":memory:"
    bool readOnly = false;
    int busyTimeoutMs = 5000;
};

// Forward-only cursor. Column indexes are 0-based.
struct IResultSet {
    virtual ~IResultSet() = default;
    virtual bool next() = 0;
    virtual int columnCount() const = 0;
    virtual std::string columnName(int idx) const = 0;
    // nullopt for SQL NULL
    virtual std::optional<std::string> text(int idx) = 0;
};

// Parameter indexes are 1-based, as in SQL.
struct IStatement {
    virtual ~IStatement() = default;
    virtual void bindText(int idx, const std::string &s) = 0;
    virtual std::unique_ptr<IResultSet> query() = 0;
};

struct IDBBackend {
    virtual ~IDBBackend() = default;
    virtual bool open(const DBConnectionInfo &info, std::string *outError = nullptr) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    // Runs a script of one or more statements, no results
    virtual bool execute(const std::string &sql, std::string *outError = nullptr) = 0;
    virtual std::unique_ptr<IStatement> prepare(const std::string &sql, std::string *outError = nullptr) = 0;

    // Storage columns differ between deployments
    virtual bool hasTable(const std::string &table) = 0;
    virtual std::vector<std::string> columnsOf(const std::string &table) = 0;
};

} // namespace CadPreview
