#ifndef SAFEINTAKE_STORAGE_HTTP_BLOB_STORAGE_HPP
#define SAFEINTAKE_STORAGE_HTTP_BLOB_STORAGE_HPP

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "storage/blob_storage.hpp"
#include "util/logger.hpp"

namespace safeintake {
namespace storage {

/**
 * @brief Uploads blobs to an object store with the media-upload call of the
 * JSON storage API:
 *
 *   POST <endpoint>/upload/storage/v1/b/<bucket>/o?uploadType=media&name=<blob>
 *
 * The body is the raw blob, Content-Type is forwarded and, when a token is
 * configured, an "Authorization: Bearer" header is added. Any transport error
 * or non-2xx status throws std::runtime_error. Returns "gs://<bucket>/<blob>".
 */
class HttpBlobStorage : public BlobStorage {
  public:
    HttpBlobStorage(const std::string& endpoint, const std::string& bearerToken, long timeoutSeconds = 60)
        : m_endpoint(endpoint), m_token(bearerToken), m_timeoutSeconds(timeoutSeconds) {
        while (!m_endpoint.empty() && m_endpoint.back() == '/')
            m_endpoint.pop_back();
        initCurl();
    }

    std::string UploadBytes(const std::string& bucket,
                            const std::string& blobName,
                            const std::vector<uint8_t>& data,
                            const std::string& contentType = "application/octet-stream") override {
        if (m_endpoint.empty()) {
            throw std::runtime_error(
                "HttpBlobStorage: object store not configured. Set objectStoreEndpoint "
                "(and objectStoreToken), rawBucket, processedBucket, or set useLocalStorage=true.");
        }

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
            throw std::runtime_error("HttpBlobStorage: curl_easy_init failed");

        const std::string url = BuildUploadUrl(curl.get(), bucket, blobName);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, ("Content-Type: " + contentType).c_str());
        if (!m_token.empty())
            headers = curl_slist_append(headers, ("Authorization: Bearer " + m_token).c_str());
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerGuard(headers,
                                                                                &curl_slist_free_all);

        std::string response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, data.empty() ? "" : reinterpret_cast<const char*>(data.data()));
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(data.size()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, m_timeoutSeconds);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw std::runtime_error("HttpBlobStorage: upload of " + bucket + "/" + blobName +
                                     " failed: " + curl_easy_strerror(res));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status < 200 || status >= 300) {
            throw std::runtime_error("HttpBlobStorage: upload of " + bucket + "/" + blobName +
                                     " rejected with HTTP " + std::to_string(status));
        }

        util::logger::debug("[HttpBlobStorage] Uploaded " + std::to_string(data.size()) +
                            " bytes to " + bucket + "/" + blobName);
        return "gs://" + bucket + "/" + blobName;
    }

    /// Upload URL for a blob; the blob name is percent-encoded.
    std::string BuildUploadUrl(const std::string& bucket, const std::string& blobName) const {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
            throw std::runtime_error("HttpBlobStorage: curl_easy_init failed");
        return BuildUploadUrl(curl.get(), bucket, blobName);
    }

    const std::string& Endpoint() const { return m_endpoint; }

  private:
    void initCurl() {
        static std::once_flag flag;
        std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    std::string BuildUploadUrl(CURL* curl, const std::string& bucket, const std::string& blobName) const {
        return m_endpoint + "/upload/storage/v1/b/" + escape(curl, bucket) +
               "/o?uploadType=media&name=" + escape(curl, blobName);
    }

    static std::string escape(CURL* curl, const std::string& value) {
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (!escaped)
            throw std::runtime_error("HttpBlobStorage: failed to escape '" + value + "'");
        std::string out(escaped);
        curl_free(escaped);
        return out;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        if (!userdata)
            return 0;
        std::string* resp = reinterpret_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp->append(ptr, total);
        return total;
    }

    std::string m_endpoint;
    std::string m_token;
    long m_timeoutSeconds;
};

} // namespace storage
} // namespace safeintake

#endif // SAFEINTAKE_STORAGE_HTTP_BLOB_STORAGE_HPP
