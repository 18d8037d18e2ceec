#pragma once
#include "DBBackend.hpp"
#include <sqlite3.h>
#include <string>
#include <memory>

namespace CadPreview {

// sqlite3 implementation. Statements hold the raw handle and must not outlive the backend.
class SQLiteBackend : public IDBBackend {
public:
    SQLiteBackend() = default;
    ~SQLiteBackend() override;

    SQLiteBackend(const SQLiteBackend&) = delete;
    SQLiteBackend& operator=(const SQLiteBackend&) = delete;

    bool open(const DBConnectionInfo &info, std::string *outError = nullptr) override;
    void close() override;
    bool isOpen() const override { return db != nullptr; }
    bool execute(const std::string &sql, std::string *outError = nullptr) override;
    std::unique_ptr<IStatement> prepare(const std::string &sql, std::string *outError = nullptr) override;

    bool hasTable(const std::string &table) override;
    std::vector<std::string> columnsOf(const std::string &table) override;

private:
    sqlite3* db = nullptr;
    std::string path_;
};

} // namespace CadPreview
