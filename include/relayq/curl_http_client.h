/**
 * @file curl_http_client.h
 * @brief libcurl implementation of HttpClient
 */

#ifndef RELAYQ_CURL_HTTP_CLIENT_H
#define RELAYQ_CURL_HTTP_CLIENT_H

#include "relayq/http_client.h"

#include <string>

namespace relayq {

/**
 * @brief Options applied to every curl easy handle
 */
struct CurlOptions {
    std::string user_agent = "relayq/1.0";
    long connect_timeout_s = 30;
    long buffer_size = 8192;
};

/**
 * @brief HttpClient backed by one libcurl easy handle per request
 *
 * Follows redirects and reports only the head of the final response.
 * Safe to use from several threads at once.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const CurlOptions& options);

    HttpResult get(const std::string& url,
                   std::uint64_t offset,
                   const HeadCallback& on_head,
                   const ChunkCallback& on_chunk) override;

    /**
     * @brief Parse the complete-length of a Content-Range value
     * @param value e.g. "bytes 100-199/200"
     * @return Total size, or nullopt for "*" or malformed values
     */
    static std::optional<std::uint64_t> parseContentRangeTotal(const std::string& value);

private:
    CurlOptions options_;
};

} // namespace relayq

#endif // RELAYQ_CURL_HTTP_CLIENT_H
