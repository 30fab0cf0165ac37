#include "storage/submission_store.hpp"
#include "util/logger.hpp"

namespace safeintake {
namespace storage {

namespace {

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // namespace

bool SubmissionStore::openDatabase(sqlite3*& db, int flags) const {
    int rc = sqlite3_open_v2(m_dbPath.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        util::logger::error("[SubmissionStore] Could not open database " + m_dbPath + ": " +
                            (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        return false;
    }
    sqlite3_busy_timeout(db, 2000);
    return true;
}

bool SubmissionStore::initSchema(sqlite3* db) const {
    const char* ddl = "CREATE TABLE IF NOT EXISTS submissions ("
                      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                      " uploaded_utc TEXT NOT NULL,"
                      " filename TEXT NOT NULL,"
                      " raw_key TEXT NOT NULL,"
                      " meta_key TEXT NOT NULL,"
                      " processed_key TEXT NOT NULL,"
                      " content_sha256 TEXT NOT NULL,"
                      " metadata TEXT NOT NULL,"
                      " anomaly TEXT NOT NULL,"
                      " has_anomaly INTEGER NOT NULL,"
                      " processed INTEGER NOT NULL,"
                      " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                      ");"
                      "CREATE INDEX IF NOT EXISTS idx_submissions_raw_key ON submissions(raw_key);";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        util::logger::error("[SubmissionStore] initSchema error: " +
                            std::string(errMsg ? errMsg : sqlite3_errstr(rc)));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SubmissionStore::RecordSubmission(const SubmissionRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3* db = nullptr;
    if (!openDatabase(db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) {
        return false;
    }
    if (!initSchema(db)) {
        sqlite3_close(db);
        return false;
    }

    const char* sql = "INSERT INTO submissions (uploaded_utc, filename, raw_key, meta_key,"
                      " processed_key, content_sha256, metadata, anomaly, has_anomaly, processed)"
                      " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
        util::logger::error(std::string("[SubmissionStore] prepare failed: ") + sqlite3_errmsg(db));
        sqlite3_close(db);
        return false;
    }

    const std::string* texts[] = {&record.uploadedUtc,   &record.filename,     &record.rawKey,
                                  &record.metaKey,       &record.processedKey, &record.contentSha256,
                                  &record.metadataJson,  &record.anomalyJson};
    int rc = SQLITE_OK;
    int index = 1;
    for (const std::string* text : texts) {
        rc = sqlite3_bind_text(stmt, index++, text->c_str(), static_cast<int>(text->size()),
                               SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
            break;
    }
    if (rc == SQLITE_OK)
        rc = sqlite3_bind_int(stmt, index++, record.hasAnomaly ? 1 : 0);
    if (rc == SQLITE_OK)
        rc = sqlite3_bind_int(stmt, index++, record.processed ? 1 : 0);
    if (rc != SQLITE_OK) {
        util::logger::error(std::string("[SubmissionStore] bind failed: ") + sqlite3_errmsg(db));
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return false;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        util::logger::error(std::string("[SubmissionStore] insert failed: ") + sqlite3_errmsg(db));
        sqlite3_close(db);
        return false;
    }

    sqlite3_close(db);
    util::logger::debug("[SubmissionStore] Recorded submission " + record.rawKey);
    return true;
}

int SubmissionStore::countWhere(const char* sql) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3* db = nullptr;
    if (!openDatabase(db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) {
        return -1;
    }
    if (!initSchema(db)) {
        sqlite3_close(db);
        return -1;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return -1;
    }
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        count = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return count;
}

int SubmissionStore::CountSubmissions() const {
    return countWhere("SELECT COUNT(*) FROM submissions;");
}

int SubmissionStore::CountAnomalous() const {
    return countWhere("SELECT COUNT(*) FROM submissions WHERE has_anomaly = 1;");
}

std::optional<SubmissionRecord> SubmissionStore::FindByRawKey(const std::string& rawKey) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3* db = nullptr;
    if (!openDatabase(db, SQLITE_OPEN_READONLY)) {
        return std::nullopt;
    }
    const char* sql = "SELECT uploaded_utc, filename, raw_key, meta_key, processed_key,"
                      " content_sha256, metadata, anomaly, has_anomaly, processed"
                      " FROM submissions WHERE raw_key = ? ORDER BY id DESC LIMIT 1;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, rawKey.c_str(), static_cast<int>(rawKey.size()), SQLITE_TRANSIENT);

    std::optional<SubmissionRecord> found;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        SubmissionRecord record;
        record.uploadedUtc = columnText(stmt, 0);
        record.filename = columnText(stmt, 1);
        record.rawKey = columnText(stmt, 2);
        record.metaKey = columnText(stmt, 3);
        record.processedKey = columnText(stmt, 4);
        record.contentSha256 = columnText(stmt, 5);
        record.metadataJson = columnText(stmt, 6);
        record.anomalyJson = columnText(stmt, 7);
        record.hasAnomaly = sqlite3_column_int(stmt, 8) != 0;
        record.processed = sqlite3_column_int(stmt, 9) != 0;
        found = record;
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return found;
}

} // namespace storage
} // namespace safeintake
