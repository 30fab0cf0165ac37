#include "ingest/ingestion_service.hpp"

#include <ctime>
#include <sstream>
#include <stdexcept>
#include "redaction/table_redactor.hpp"
#include "storage/http_blob_storage.hpp"
#include "storage/local_blob_storage.hpp"
#include "tabular/csv_table.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

namespace safeintake {
namespace ingest {

using util::text::jsonEscape;

std::string SubmissionMetadata::ToJson() const
{
    std::ostringstream oss;
    oss << R"({"name":")" << jsonEscape(name)
        << R"(","email":")" << jsonEscape(email)
        << R"(","phone":")" << jsonEscape(phone)
        << R"(","filename":")" << jsonEscape(filename)
        << R"(","uploaded_utc":")" << jsonEscape(uploadedUtc)
        << R"(","phone_valid":)" << (phoneValid ? "true" : "false")
        << R"(,"sha256":")" << contentSha256
        << R"(","anomaly":)" << anomaly.ToJson() << "}";
    return oss.str();
}

std::string IngestionResult::ToJson() const
{
    std::ostringstream oss;
    oss << R"({"raw_bucket":")" << jsonEscape(rawBucket)
        << R"(","processed_bucket":")" << jsonEscape(processedBucket)
        << R"(","raw_key":")" << jsonEscape(rawKey)
        << R"(","meta_key":")" << jsonEscape(metaKey)
        << R"(","processed_key":")" << jsonEscape(processedKey)
        << R"(","raw_uri":")" << jsonEscape(rawUri)
        << R"(","meta_uri":")" << jsonEscape(metaUri)
        << R"(","processed_uri":")" << jsonEscape(processedUri)
        << R"(","processed":)" << (processed ? "true" : "false")
        << R"(,"indexed":)" << (indexed ? "true" : "false")
        << R"(,"anomaly":)" << anomaly.ToJson() << "}";
    return oss.str();
}

std::string FormatUploadTimestamp(std::chrono::system_clock::time_point tp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &utc) == 0) {
        throw std::runtime_error("IngestionService: failed to format upload timestamp");
    }
    return buf;
}

std::string SanitizeFilename(const std::string &filename)
{
    const auto slash = filename.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? filename : filename.substr(slash + 1);
    base = util::text::trim(base);
    if (base.empty() || base == "." || base == "..") {
        return "upload";
    }
    return base;
}

std::string FileStem(const std::string &filename)
{
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return filename;
    }
    return filename.substr(0, dot);
}

std::string GuessContentType(const std::string &filename)
{
    using util::text::endsWithIgnoreCase;
    if (endsWithIgnoreCase(filename, ".csv")) {
        return "text/csv";
    }
    if (endsWithIgnoreCase(filename, ".txt") || endsWithIgnoreCase(filename, ".log")) {
        return "text/plain";
    }
    if (endsWithIgnoreCase(filename, ".json")) {
        return "application/json";
    }
    return "application/octet-stream";
}

IngestionService::IngestionService(const config::IntakeConfig &config,
                                   storage::BlobStorage &storage,
                                   storage::SubmissionStore *index,
                                   util::ThreadPool *pool)
    : m_config(config),
      m_storage(storage),
      m_index(index),
      m_pool(pool),
      m_redactor(redaction::RedactionPolicy::FromConfig(config)),
      m_clock([] { return std::chrono::system_clock::now(); })
{
}

IngestionResult IngestionService::Ingest(const Upload &upload,
                                         const std::string &name,
                                         const std::string &email,
                                         const std::string &phone)
{
    IngestionResult result;
    result.rawBucket = m_config.rawBucket;
    result.processedBucket = m_config.processedBucket;

    const std::string filename = SanitizeFilename(upload.filename);
    const std::string ts = FormatUploadTimestamp(m_clock());
    result.rawKey = "raw/" + ts + "-" + filename;
    result.metaKey = "raw/" + ts + "-" + FileStem(filename) + ".json";
    result.processedKey = "processed/" + ts + "-redacted-" + filename;

    const std::string rawType = upload.contentType.empty() ? "application/octet-stream" : upload.contentType;
    result.rawUri = m_storage.UploadBytes(m_config.rawBucket, result.rawKey, upload.content, rawType);
    util::logger::info("[IngestionService] Stored raw upload " + result.rawKey + " (" +
                       std::to_string(upload.content.size()) + " bytes)");

    SubmissionMetadata metadata;
    metadata.name = name;
    metadata.email = email;
    metadata.phone = phone;
    metadata.filename = filename;
    metadata.uploadedUtc = ts;
    metadata.phoneValid = validation::IsValidPhone(phone);
    metadata.contentSha256 = util::hashing::sha256Hex(upload.content);
    metadata.anomaly = validation::DetectAnomalies(name, email, phone);
    result.anomaly = metadata.anomaly;

    const std::string metadataJson = metadata.ToJson();
    result.metaUri = m_storage.UploadText(m_config.rawBucket, result.metaKey, metadataJson, "application/json");
    if (metadata.anomaly.hasAnomaly) {
        util::logger::warn("[IngestionService] " + std::to_string(metadata.anomaly.details.size()) +
                           " anomaly(ies) flagged for " + result.rawKey);
    }

    try {
        const bool isCsv = util::text::endsWithIgnoreCase(filename, ".csv");
        const std::string redacted = redactContent(filename, upload.content);
        result.processedUri = m_storage.UploadText(m_config.processedBucket, result.processedKey, redacted,
                                                   isCsv ? "text/csv" : "text/plain");
        result.processed = true;
        util::logger::info("[IngestionService] Stored redacted copy " + result.processedKey);
    } catch (const std::exception &e) {
        util::logger::error("[IngestionService] Processing failed for " + result.rawKey + ": " + e.what());
    }

    if (m_index) {
        storage::SubmissionRecord record;
        record.uploadedUtc = ts;
        record.filename = filename;
        record.rawKey = result.rawKey;
        record.metaKey = result.metaKey;
        record.processedKey = result.processedKey;
        record.contentSha256 = metadata.contentSha256;
        record.metadataJson = metadataJson;
        record.anomalyJson = metadata.anomaly.ToJson();
        record.hasAnomaly = metadata.anomaly.hasAnomaly;
        record.processed = result.processed;
        result.indexed = m_index->RecordSubmission(record);
        if (!result.indexed) {
            util::logger::warn("[IngestionService] Submission " + result.rawKey + " was not indexed");
        }
    }

    return result;
}

std::string IngestionService::redactContent(const std::string &filename,
                                            const std::vector<uint8_t> &content) const
{
    const std::string text = util::text::decodeUtf8Lossy(content);

    if (!util::text::endsWithIgnoreCase(filename, ".csv")) {
        return m_redactor.Redact(text);
    }

    tabular::CsvTable table = tabular::ParseCsv(text);
    redaction::TableRedactor tableRedactor(m_redactor, m_pool, m_config.tableParallelThreshold);
    const redaction::TableRedactionStats stats = tableRedactor.RedactTable(table);
    util::logger::debug("[IngestionService] CSV " + filename + ": " + std::to_string(table.RowCount()) +
                        " row(s), " + std::to_string(stats.cellsChanged) + " cell(s) redacted");
    return tabular::SerializeCsv(table);
}

std::unique_ptr<storage::BlobStorage> MakeBlobStorage(const config::IntakeConfig &config)
{
    if (config.useLocalStorage) {
        util::logger::info("[IngestionService] Using local storage under " + config.storageRoot);
        return std::make_unique<storage::LocalBlobStorage>(config.storageRoot);
    }
    util::logger::info("[IngestionService] Using object store at " + config.objectStoreEndpoint);
    return std::make_unique<storage::HttpBlobStorage>(config.objectStoreEndpoint,
                                                      config.objectStoreToken);
}

} // namespace ingest
} // namespace safeintake
