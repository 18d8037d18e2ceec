#include "db/FileRecordRepository.hpp"
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <algorithm>

namespace CadPreview {

static std::vector<std::string> parseNameList(const std::string& text){
    std::vector<std::string> out;
    if(text.empty()) return out;
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if(j.is_discarded() || !j.is_array()){
        PLOGW << "FileRecordRepository: ignoring malformed name list: " << text.substr(0, 120);
        return out;
    }
    for(const auto& v : j){ if(v.is_string()) out.push_back(v.get<std::string>()); }
    return out;
}

static std::string joinColumns(const std::vector<std::string>& cols){
    std::string s;
    for(size_t i = 0; i < cols.size(); ++i){ if(i) s += ", "; s += cols[i]; }
    return s;
}

// Metadata column names differ between the files and uploads tables.
struct RecordColumns {
    const char* table;
    const char* id;
    const char* filename;
    const char* mime;
};

static const RecordColumns kFilesColumns{"files", "id", "filename", "mime"};
static const RecordColumns kUploadsColumns{"uploads", "id", "file_name", "mime_type"};

static FileRecord readRecord(IResultSet& rs, const RecordColumns& cols, const std::string& quoteId){
    FileRecord r;
    r.table = cols.table;
    r.quoteId = quoteId;
    for(int i = 0; i < rs.columnCount(); ++i){
        auto v = rs.text(i);
        if(!v) continue;
        const std::string name = rs.columnName(i);
        if(name == cols.id) r.fileId = *v;
        else if(name == cols.filename) r.declaredFilename = *v;
        else if(name == cols.mime) r.mime = *v;
        else r.fields[name] = *v;
    }
    return r;
}

FileRecordRepository::FileRecordRepository(std::shared_ptr<IDBBackend> db) : db_(std::move(db)) {}

const std::vector<std::string>& FileRecordRepository::storageColumns(){
    static const std::vector<std::string> cols{"storage_bucket_id", "storage_path", "bucket_id", "file_path"};
    return cols;
}

std::vector<std::string> FileRecordRepository::presentColumns(const std::string& table, const std::vector<std::string>& wanted){
    const std::vector<std::string> have = db_->columnsOf(table);
    std::vector<std::string> out;
    for(const auto& c : wanted){
        if(std::find(have.begin(), have.end(), c) != have.end()) out.push_back(c);
    }
    return out;
}

bool FileRecordRepository::loadQuote(const std::string& quoteId, QuoteFileSource& out, std::string* outError){
    if(!db_ || !db_->isOpen()){ if(outError) *outError = "DB not open"; return false; }
    if(!db_->hasTable("quotes")){ if(outError) *outError = "quotes table missing"; return false; }

    auto cols = presentColumns("quotes", {"id", "upload_id", "file_name", "file_names", "upload_file_names"});
    auto stmt = db_->prepare("SELECT " + joinColumns(cols) + " FROM quotes WHERE id = ?;", outError);
    if(!stmt) return false;
    stmt->bindText(1, quoteId);
    auto rs = stmt->query();
    if(!rs->next()){ if(outError) *outError = "quote not found"; return false; }

    out = QuoteFileSource{};
    for(int i = 0; i < rs->columnCount(); ++i){
        auto v = rs->text(i);
        if(!v) continue;
        const std::string name = rs->columnName(i);
        if(name == "id") out.quoteId = *v;
        else if(name == "upload_id") out.uploadId = *v;
        else if(name == "file_name") out.fileName = *v;
        else if(name == "file_names") out.fileNames = parseNameList(*v);
        else if(name == "upload_file_names") out.uploadFileNames = parseNameList(*v);
    }
    return true;
}

std::vector<FileRecord> FileRecordRepository::loadFileRecords(const QuoteFileSource& quote, std::string* outError){
    std::vector<FileRecord> out;
    if(!db_ || !db_->isOpen()){ if(outError) *outError = "DB not open"; return out; }

    if(db_->hasTable("files")){
        const std::vector<std::string> have = db_->columnsOf("files");
        const bool hasQuoteId = std::find(have.begin(), have.end(), "quote_id") != have.end();
        const bool hasCreatedAt = std::find(have.begin(), have.end(), "created_at") != have.end();
        std::vector<std::string> cols = presentColumns("files", {kFilesColumns.id, kFilesColumns.filename, kFilesColumns.mime});
        auto storage = presentColumns("files", storageColumns());
        cols.insert(cols.end(), storage.begin(), storage.end());

        if(hasQuoteId && !cols.empty()){
            std::string order = hasCreatedAt ? " ORDER BY created_at ASC, rowid ASC" : " ORDER BY rowid ASC";
            auto stmt = db_->prepare("SELECT " + joinColumns(cols) + " FROM files WHERE quote_id = ?" + order + ";", outError);
            if(stmt){
                stmt->bindText(1, quote.quoteId);
                auto rs = stmt->query();
                while(rs->next()) out.push_back(readRecord(*rs, kFilesColumns, quote.quoteId));
            }
        }
    }

    if(!quote.uploadId.empty() && db_->hasTable("uploads")){
        std::vector<std::string> cols = presentColumns("uploads", {kUploadsColumns.id, kUploadsColumns.filename, kUploadsColumns.mime});
        auto storage = presentColumns("uploads", storageColumns());
        cols.insert(cols.end(), storage.begin(), storage.end());
        if(!cols.empty()){
            auto stmt = db_->prepare("SELECT " + joinColumns(cols) + " FROM uploads WHERE id = ?;", outError);
            if(stmt){
                stmt->bindText(1, quote.uploadId);
                auto rs = stmt->query();
                if(rs->next()) out.push_back(readRecord(*rs, kUploadsColumns, quote.quoteId));
            }
        }
    }
    PLOGD << "FileRecordRepository: quote=" << quote.quoteId << " records=" << out.size();
    return out;
}

} // namespace CadPreview
