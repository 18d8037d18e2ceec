#pragma once
#include "DBBackend.hpp"
#include "StorageResolver.hpp"
#include <memory>
#include <string>
#include <vector>

namespace CadPreview {

struct QuoteFileSource {
    std::string quoteId;
    std::string uploadId;
    std::string fileName;
    std::vector<std::string> fileNames;       // JSON array column
    std::vector<std::string> uploadFileNames; // JSON array column

    std::vector<std::string> declaredNames() const { return extractDeclaredNames(fileNames, uploadFileNames, fileName); }
};

// Reads quotes, files and uploads rows. Storage columns differ between deployments
// (canonical storage_* vs legacy bucket_id/file_path), so they are probed once per
// table and only the present ones are selected.
class FileRecordRepository {
public:
    explicit FileRecordRepository(std::shared_ptr<IDBBackend> db);

    bool loadQuote(const std::string& quoteId, QuoteFileSource& out, std::string* outError = nullptr);
    std::vector<FileRecord> loadFileRecords(const QuoteFileSource& quote, std::string* outError = nullptr);

    static const std::vector<std::string>& storageColumns();

private:
    // Columns of `wanted` that `table` has, in `wanted` order
    std::vector<std::string> presentColumns(const std::string& table, const std::vector<std::string>& wanted);

    std::shared_ptr<IDBBackend> db_;
};

} // namespace CadPreview
