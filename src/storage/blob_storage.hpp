#ifndef SAFEINTAKE_STORAGE_BLOB_STORAGE_HPP
#define SAFEINTAKE_STORAGE_BLOB_STORAGE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace safeintake {
namespace storage {

/*
  BlobStorage
  --------------------------------
  Destination for raw uploads, metadata records and redacted copies.
  A blob is addressed by (bucket, blobName); blob names may contain '/'.

  Implementations:
    LocalBlobStorage  - files below a root directory
    HttpBlobStorage   - object store upload over HTTP (libcurl)

  UploadBytes returns a URI for the stored blob and throws std::runtime_error
  when the blob could not be stored.
*/
class BlobStorage
{
public:
    virtual ~BlobStorage() = default;

    virtual std::string UploadBytes(const std::string &bucket,
                                    const std::string &blobName,
                                    const std::vector<uint8_t> &data,
                                    const std::string &contentType = "application/octet-stream") = 0;

    std::string UploadText(const std::string &bucket,
                           const std::string &blobName,
                           const std::string &text,
                           const std::string &contentType = "text/plain")
    {
        return UploadBytes(bucket, blobName, std::vector<uint8_t>(text.begin(), text.end()),
                           contentType);
    }
};

} // namespace storage
} // namespace safeintake

#endif // SAFEINTAKE_STORAGE_BLOB_STORAGE_HPP
