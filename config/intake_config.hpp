#ifndef SAFEINTAKE_CONFIG_INTAKE_CONFIG_HPP
#define SAFEINTAKE_CONFIG_INTAKE_CONFIG_HPP

#include <cstddef>
#include <string>

/**
 * @file intake_config.hpp
 * @brief Runtime settings for a SafeIntake process.
 *
 * USAGE:
 *   - Populated with defaults on construction, then overridden by
 *     util/config_parser.hpp from a key=value file.
 *   - Covers storage (buckets, backend, paths), logging, table fan-out
 *     and the per-category redaction policy.
 */

namespace safeintake {
namespace config {

/**
 * @struct IntakeConfig
 * @brief Settings for storage, persistence, logging and redaction policy.
 */
struct IntakeConfig
{
    IntakeConfig()
        : rawBucket("safeintake-raw"),
          processedBucket("safeintake-processed"),
          useLocalStorage(true),
          storageRoot("local_uploads"),
          objectStoreEndpoint(""),
          objectStoreToken(""),
          databasePath("safeintake.sqlite"),
          logLevel("info"),
          logFile(""),
          workerThreads(0),
          tableParallelThreshold(512),
          maskEmail(true),
          maskSsn(false),
          maskDateOfBirth(false),
          maskCreditCard(false),
          maskPhone(true)
    {
    }

    /// Bucket receiving the untouched upload and its metadata JSON.
    std::string rawBucket;

    /// Bucket receiving the redacted copy.
    std::string processedBucket;

    /// true: write blobs below storageRoot; false: upload to the object store.
    bool useLocalStorage;

    std::string storageRoot;

    /// Base URL of the object store, e.g. "https://storage.googleapis.com".
    std::string objectStoreEndpoint;

    /// Bearer token sent with object store uploads (may be empty).
    std::string objectStoreToken;

    /// SQLite file holding the submission index.
    std::string databasePath;

    std::string logLevel;

    /// Optional log file; empty means console only.
    std::string logFile;

    /// Worker threads for table redaction; 0 means hardware concurrency.
    std::size_t workerThreads;

    /// Tables with at least this many data rows are redacted on the worker pool.
    std::size_t tableParallelThreshold;

    // Redaction policy: true masks the category, false only detects it.
    bool maskEmail;
    bool maskSsn;
    bool maskDateOfBirth;
    bool maskCreditCard;
    bool maskPhone;
};

} // namespace config
} // namespace safeintake

#endif // SAFEINTAKE_CONFIG_INTAKE_CONFIG_HPP
