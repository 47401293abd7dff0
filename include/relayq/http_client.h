/**
 * @file http_client.h
 * @brief Byte-range HTTP GET abstraction used by TransferEngine
 */

#ifndef RELAYQ_HTTP_CLIENT_H
#define RELAYQ_HTTP_CLIENT_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace relayq {

/**
 * @brief Status line and size headers of a response
 */
struct HttpResponseHead {
    long status = 0;

    /// Content-Length of this response body, if sent
    std::optional<std::uint64_t> content_length;

    /// Complete-length from "Content-Range: bytes a-b/T", if sent and known
    std::optional<std::uint64_t> content_range_total;
};

/**
 * @brief Outcome of one GET at the transport level
 *
 * ok is true when the exchange completed, whatever the HTTP status.
 * aborted is true when a callback asked to stop.
 */
struct HttpResult {
    bool ok = false;
    bool aborted = false;
    std::string error;
};

class HttpClient {
public:
    /// Return false to abort the transfer
    using HeadCallback = std::function<bool(const HttpResponseHead&)>;
    /// Return false to abort the transfer
    using ChunkCallback = std::function<bool(const char* data, std::size_t size)>;

    virtual ~HttpClient() = default;

    /**
     * @brief GET url starting at a byte offset
     * @param url Resource URL
     * @param offset First byte wanted; 0 sends no Range header
     * @param on_head Called once with the final response head before any body
     * @param on_chunk Called for each body chunk in order
     */
    virtual HttpResult get(const std::string& url,
                           std::uint64_t offset,
                           const HeadCallback& on_head,
                           const ChunkCallback& on_chunk) = 0;
};

} // namespace relayq

#endif // RELAYQ_HTTP_CLIENT_H
