#ifndef SAFEINTAKE_STORAGE_LOCAL_BLOB_STORAGE_HPP
#define SAFEINTAKE_STORAGE_LOCAL_BLOB_STORAGE_HPP

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include "storage/blob_storage.hpp"
#include "util/logger.hpp"

namespace safeintake {
namespace storage {

/*
  LocalBlobStorage
  --------------------------------
  Writes each blob to <root>/<bucket>/<blobName>, creating parent directories
  on demand, and returns "local://<path>". Existing files are overwritten.
  Bucket and blob names must stay inside the root: absolute names and ".."
  segments are rejected.
*/
class LocalBlobStorage : public BlobStorage
{
public:
    explicit LocalBlobStorage(const std::string &root = "local_uploads")
        : m_root(root)
    {
    }

    std::string UploadBytes(const std::string &bucket,
                            const std::string &blobName,
                            const std::vector<uint8_t> &data,
                            const std::string &contentType = "application/octet-stream") override
    {
        namespace fs = std::filesystem;
        const fs::path dest = ResolvePath(bucket, blobName);

        std::error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("LocalBlobStorage: cannot create directory " +
                                     dest.parent_path().string() + ": " + ec.message());
        }

        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("LocalBlobStorage: cannot open " + dest.string() + " for writing");
        }
        if (!data.empty()) {
            out.write(reinterpret_cast<const char *>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        }
        out.close();
        if (!out) {
            throw std::runtime_error("LocalBlobStorage: write failed for " + dest.string());
        }

        util::logger::debug("[LocalBlobStorage] Stored " + std::to_string(data.size()) + " bytes (" +
                            contentType + ") at " + dest.generic_string());
        return "local://" + dest.generic_string();
    }

    std::filesystem::path ResolvePath(const std::string &bucket, const std::string &blobName) const
    {
        namespace fs = std::filesystem;
        const fs::path bucketPath(bucket);
        const fs::path blobPath(blobName);
        if (bucket.empty() || blobName.empty()) {
            throw std::runtime_error("LocalBlobStorage: bucket and blob name must not be empty");
        }
        if (bucketPath.is_absolute() || blobPath.is_absolute() ||
            containsParentRef(bucketPath) || containsParentRef(blobPath)) {
            throw std::runtime_error("LocalBlobStorage: refusing path outside storage root: " +
                                     bucket + "/" + blobName);
        }
        return m_root / bucketPath / blobPath;
    }

    const std::filesystem::path &Root() const { return m_root; }

private:
    static bool containsParentRef(const std::filesystem::path &p)
    {
        for (const auto &part : p) {
            if (part == "..") {
                return true;
            }
        }
        return false;
    }

    std::filesystem::path m_root;
};

} // namespace storage
} // namespace safeintake

#endif // SAFEINTAKE_STORAGE_LOCAL_BLOB_STORAGE_HPP
