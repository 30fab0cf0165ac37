#ifndef SAFEINTAKE_STORAGE_SUBMISSION_STORE_HPP
#define SAFEINTAKE_STORAGE_SUBMISSION_STORE_HPP

#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace safeintake {
namespace storage {

/*
  SubmissionRecord
  --------------------------------
  One row of the submission index: where the three blobs of an upload were
  stored, the metadata and anomaly JSON written for it, and the SHA-256 of
  the raw bytes.
*/
struct SubmissionRecord {
    std::string uploadedUtc;
    std::string filename;
    std::string rawKey;
    std::string metaKey;
    std::string processedKey;
    std::string contentSha256;
    std::string metadataJson;
    std::string anomalyJson;
    bool hasAnomaly = false;
    bool processed = false;
};

/*
  SubmissionStore
  --------------------------------
  SQLite index of every ingestion, table "submissions". The database file is
  opened per call and the schema is created on first use. Calls on one store
  are serialized; separate processes rely on SQLite locking.

  Failures are logged and reported through the return value (false / -1 /
  nullopt); they never throw, so a broken index does not abort an ingestion.
*/
class SubmissionStore {
  public:
    explicit SubmissionStore(const std::string& dbPath) : m_dbPath(dbPath) {}

    bool RecordSubmission(const SubmissionRecord& record);

    // -1 when the database cannot be read
    int CountSubmissions() const;
    int CountAnomalous() const;

    std::optional<SubmissionRecord> FindByRawKey(const std::string& rawKey) const;

    const std::string& DatabasePath() const { return m_dbPath; }

  private:
    bool openDatabase(sqlite3*& db, int flags) const;
    bool initSchema(sqlite3* db) const;
    int countWhere(const char* sql) const;

    std::string m_dbPath;
    mutable std::mutex m_mutex;
};

} // namespace storage
} // namespace safeintake

#endif // SAFEINTAKE_STORAGE_SUBMISSION_STORE_HPP
