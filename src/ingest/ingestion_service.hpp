#ifndef SAFEINTAKE_INGEST_INGESTION_SERVICE_HPP
#define SAFEINTAKE_INGEST_INGESTION_SERVICE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "config/intake_config.hpp"
#include "redaction/redactor.hpp"
#include "storage/blob_storage.hpp"
#include "storage/submission_store.hpp"
#include "util/thread_pool.hpp"
#include "validation/anomaly_classifier.hpp"

/**
 * @file ingestion_service.hpp
 * @brief One upload, end to end: store the raw bytes, store a metadata JSON
 *        describing the submitter, store a redacted copy, index the result.
 *
 * Blob layout for an upload "report.csv" at 2024-03-01 12:00:05 UTC:
 *   raw bucket        raw/20240301-120005-report.csv
 *   raw bucket        raw/20240301-120005-report.json
 *   processed bucket  processed/20240301-120005-redacted-report.csv
 *
 * Failures storing the raw upload or its metadata propagate to the caller.
 * Failures producing the redacted copy are logged and reported through
 * IngestionResult::processed. The submission index is best-effort.
 *
 * USAGE EXAMPLE:
 *   @code
 *   safeintake::config::IntakeConfig cfg;
 *   safeintake::storage::LocalBlobStorage blobs(cfg.storageRoot);
 *   safeintake::storage::SubmissionStore index(cfg.databasePath);
 *   safeintake::ingest::IngestionService service(cfg, blobs, &index);
 *   auto result = service.Ingest(upload, "Jane Doe", "jane.doe@example.org", "4155552671");
 *   @endcode
 */

namespace safeintake {
namespace ingest {

struct Upload
{
    std::string filename;
    std::vector<uint8_t> content;
    std::string contentType = "application/octet-stream";
};

struct SubmissionMetadata
{
    std::string name;
    std::string email;
    std::string phone;
    std::string filename;
    std::string uploadedUtc;
    bool phoneValid = false;
    std::string contentSha256;
    validation::AnomalyReport anomaly;

    std::string ToJson() const;
};

struct IngestionResult
{
    std::string rawBucket;
    std::string processedBucket;
    std::string rawKey;
    std::string metaKey;
    std::string processedKey;
    std::string rawUri;
    std::string metaUri;
    std::string processedUri;   ///< empty when processed == false
    bool processed = false;
    bool indexed = false;
    validation::AnomalyReport anomaly;

    std::string ToJson() const;
};

/// "YYYYMMDD-HHMMSS" in UTC.
std::string FormatUploadTimestamp(std::chrono::system_clock::time_point tp);

/// Last path component of a client-supplied name; "upload" if nothing is left.
std::string SanitizeFilename(const std::string &filename);

/// Name without its final extension ("a.tar.gz" -> "a.tar", ".env" -> ".env").
std::string FileStem(const std::string &filename);

/// Content type guessed from the file extension.
std::string GuessContentType(const std::string &filename);

class IngestionService
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param config Buckets, redaction policy and table fan-out settings.
     * @param storage Blob backend; must outlive the service.
     * @param index Optional submission index; null disables indexing.
     * @param pool Optional worker pool for large CSV tables.
     */
    IngestionService(const config::IntakeConfig &config,
                     storage::BlobStorage &storage,
                     storage::SubmissionStore *index = nullptr,
                     util::ThreadPool *pool = nullptr);

    /**
     * @throw std::runtime_error if the raw upload or its metadata cannot be stored.
     */
    IngestionResult Ingest(const Upload &upload,
                           const std::string &name,
                           const std::string &email,
                           const std::string &phone);

    /// Replace the wall clock used to stamp uploads.
    void SetClock(Clock clock) { m_clock = std::move(clock); }

    const redaction::Redactor &GetRedactor() const { return m_redactor; }

private:
    std::string redactContent(const std::string &filename, const std::vector<uint8_t> &content) const;

    config::IntakeConfig m_config;
    storage::BlobStorage &m_storage;
    storage::SubmissionStore *m_index;
    util::ThreadPool *m_pool;
    redaction::Redactor m_redactor;
    Clock m_clock;
};

/**
 * @brief Blob backend selected by config.useLocalStorage.
 */
std::unique_ptr<storage::BlobStorage> MakeBlobStorage(const config::IntakeConfig &config);

} // namespace ingest
} // namespace safeintake

#endif // SAFEINTAKE_INGEST_INGESTION_SERVICE_HPP
