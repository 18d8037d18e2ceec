#include <gtest/gtest.h>
#include "db/SQLiteBackend.hpp"
#include "db/FileRecordRepository.hpp"

using namespace CadPreview;

namespace {

std::shared_ptr<SQLiteBackend> openMemoryDb(){
    auto db = std::make_shared<SQLiteBackend>();
    DBConnectionInfo info;
    info.path = ":memory:";
    std::string err;
    EXPECT_TRUE(db->open(info, &err)) << err;
    return db;
}

void exec(IDBBackend& db, const std::string& sql){
    std::string err;
    ASSERT_TRUE(db.execute(sql, &err)) << err << "\n" << sql;
}

} // namespace

TEST(FileRecordRepositoryTest, CanonicalSchemaLoadsQuoteAndFiles) {
    auto db = openMemoryDb();
    exec(*db, "CREATE TABLE quotes (id TEXT PRIMARY KEY, upload_id TEXT, file_name TEXT, file_names TEXT);");
    exec(*db, "CREATE TABLE files (id TEXT, quote_id TEXT, filename TEXT, mime TEXT, storage_bucket_id TEXT, storage_path TEXT, created_at INTEGER);");
    exec(*db, "INSERT INTO quotes VALUES ('q1', NULL, 'bracket.step', '[\"bracket.step\", \"lid.stl\", 7]');");
    exec(*db, "INSERT INTO files VALUES ('f2', 'q1', 'lid.stl', 'model/stl', 'cad_uploads', 'quotes/q1/lid.stl', 20);");
    exec(*db, "INSERT INTO files VALUES ('f1', 'q1', 'bracket.step', NULL, 'cad-uploads', '/quotes/q1/bracket.step', 10);");
    exec(*db, "INSERT INTO files VALUES ('f9', 'q2', 'other.stl', NULL, 'cad_uploads', 'quotes/q2/other.stl', 5);");

    FileRecordRepository repo(db);
    QuoteFileSource quote;
    std::string err;
    ASSERT_TRUE(repo.loadQuote("q1", quote, &err)) << err;
    EXPECT_EQ(quote.quoteId, "q1");
    EXPECT_TRUE(quote.uploadId.empty());
    EXPECT_EQ(quote.fileNames, (std::vector<std::string>{"bracket.step", "lid.stl"}));
    EXPECT_EQ(quote.declaredNames(), (std::vector<std::string>{"bracket.step", "lid.stl"}));

    auto records = repo.loadFileRecords(quote, &err);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].fileId.value_or(""), "f1");
    EXPECT_EQ(records[0].table, "files");
    EXPECT_EQ(records[0].fields.at("storage_bucket_id"), "cad-uploads");
    EXPECT_EQ(records[0].declaredFilename.value_or(""), "bracket.step");
    EXPECT_FALSE(records[0].mime.has_value());
    EXPECT_EQ(records[1].mime.value_or(""), "model/stl");

    StorageResolver resolver;
    auto id = resolver.resolve(records[0]);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->bucket, "cad_uploads");
    EXPECT_EQ(id->path, "quotes/q1/bracket.step");
}

TEST(FileRecordRepositoryTest, LegacySchemaWithUploadRow) {
    auto db = openMemoryDb();
    exec(*db, "CREATE TABLE quotes (id TEXT PRIMARY KEY, upload_id TEXT, file_name TEXT);");
    exec(*db, "CREATE TABLE files (quote_id TEXT, bucket_id TEXT, file_path TEXT);");
    exec(*db, "CREATE TABLE uploads (id TEXT, file_name TEXT, mime_type TEXT, bucket_id TEXT, file_path TEXT);");
    exec(*db, "INSERT INTO quotes VALUES ('q7', 'u1', 'housing.obj');");
    exec(*db, "INSERT INTO files VALUES ('q7', 'cad_uploads', 'legacy/q7/a.stl');");
    exec(*db, "INSERT INTO uploads VALUES ('u1', 'housing.obj', 'text/plain', NULL, 'cad_uploads/legacy/u1/housing.obj');");

    FileRecordRepository repo(db);
    QuoteFileSource quote;
    ASSERT_TRUE(repo.loadQuote("q7", quote));
    EXPECT_EQ(quote.uploadId, "u1");
    EXPECT_TRUE(quote.fileNames.empty());
    EXPECT_EQ(quote.declaredNames(), (std::vector<std::string>{"housing.obj"}));

    auto records = repo.loadFileRecords(quote);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].table, "files");
    EXPECT_FALSE(records[0].fileId.has_value());
    EXPECT_EQ(records[0].fields.count("storage_path"), 0u);
    EXPECT_EQ(records[1].table, "uploads");
    EXPECT_EQ(records[1].fields.count("bucket_id"), 0u);

    StorageResolver resolver;
    auto fromUpload = resolver.resolve(records[1]);
    ASSERT_TRUE(fromUpload.has_value());
    EXPECT_EQ(fromUpload->bucket, "cad_uploads");
    EXPECT_EQ(fromUpload->path, "legacy/u1/housing.obj");
    EXPECT_TRUE(fromUpload->provenance.bucketFromPathPrefix);
}

TEST(FileRecordRepositoryTest, MissingQuoteAndClosedDb) {
    auto db = openMemoryDb();
    FileRecordRepository repo(db);
    QuoteFileSource quote;
    std::string err;
    EXPECT_FALSE(repo.loadQuote("q1", quote, &err));
    EXPECT_EQ(err, "quotes table missing");

    exec(*db, "CREATE TABLE quotes (id TEXT PRIMARY KEY);");
    EXPECT_FALSE(repo.loadQuote("nope", quote, &err));
    EXPECT_EQ(err, "quote not found");

    quote.quoteId = "nope";
    EXPECT_TRUE(repo.loadFileRecords(quote).empty());

    db->close();
    EXPECT_FALSE(repo.loadQuote("q1", quote, &err));
    EXPECT_EQ(err, "DB not open");
}

TEST(SQLiteBackendTest, ProbesSchemaAndReadsNulls) {
    auto db = openMemoryDb();
    exec(*db, "CREATE TABLE uploads (id TEXT, \"file name\" TEXT, bucket_id TEXT);"
              "INSERT INTO uploads VALUES ('u1', NULL, 'cad_uploads');");
    EXPECT_TRUE(db->hasTable("uploads"));
    EXPECT_FALSE(db->hasTable("files"));
    EXPECT_EQ(db->columnsOf("uploads"), (std::vector<std::string>{"id", "file name", "bucket_id"}));
    EXPECT_TRUE(db->columnsOf("missing").empty());

    std::string err;
    auto stmt = db->prepare("SELECT id, \"file name\", bucket_id FROM uploads WHERE id = ?;", &err);
    ASSERT_NE(stmt, nullptr) << err;
    stmt->bindText(1, "u1");
    auto rows = stmt->query();
    ASSERT_TRUE(rows->next());
    EXPECT_EQ(rows->columnCount(), 3);
    EXPECT_EQ(rows->columnName(2), "bucket_id");
    EXPECT_EQ(rows->text(0).value_or(""), "u1");
    EXPECT_FALSE(rows->text(1).has_value());
    EXPECT_FALSE(rows->next());

    EXPECT_EQ(db->prepare("SELECT nope FROM uploads;", &err), nullptr);
    EXPECT_FALSE(err.empty());
}
