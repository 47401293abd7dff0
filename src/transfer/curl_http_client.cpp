/**
 * @file curl_http_client.cpp
 * @brief Implementation of CurlHttpClient
 */

#include "relayq/curl_http_client.h"
#include "relayq/errors.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace relayq {

namespace {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw RelayqException(ErrorCode::TRANSFER_FAILED, "Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

struct RequestContext {
    CURL* handle = nullptr;
    const HttpClient::HeadCallback* on_head = nullptr;
    const HttpClient::ChunkCallback* on_chunk = nullptr;
    HttpResponseHead head;
    bool head_delivered = false;
    bool aborted = false;
};

std::string trimLine(const char* data, size_t size) {
    std::string line(data, size);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

bool startsWithNoCase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(str[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string headerValue(const std::string& line) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return "";
    }
    size_t start = line.find_first_not_of(" \t", colon + 1);
    return start == std::string::npos ? "" : line.substr(start);
}

bool deliverHead(RequestContext& ctx) {
    ctx.head_delivered = true;
    if (ctx.head.status == 0) {
        long code = 0;
        curl_easy_getinfo(ctx.handle, CURLINFO_RESPONSE_CODE, &code);
        ctx.head.status = code;
    }
    if (!(*ctx.on_head)(ctx.head)) {
        ctx.aborted = true;
        return false;
    }
    return true;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    const size_t total = size * nitems;
    std::string line = trimLine(buffer, total);

    if (startsWithNoCase(line, "HTTP/")) {
        // A new response begins (redirects produce several)
        ctx->head = HttpResponseHead();
        size_t space = line.find(' ');
        if (space != std::string::npos) {
            try {
                ctx->head.status = std::stol(line.substr(space + 1, 3));
            } catch (const std::exception&) {
                ctx->head.status = 0;
            }
        }
    } else if (startsWithNoCase(line, "content-length:")) {
        try {
            ctx->head.content_length = std::stoull(headerValue(line));
        } catch (const std::exception&) {
            ctx->head.content_length.reset();
        }
    } else if (startsWithNoCase(line, "content-range:")) {
        ctx->head.content_range_total = CurlHttpClient::parseContentRangeTotal(headerValue(line));
    }

    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    const size_t total = size * nmemb;

    if (!ctx->head_delivered && !deliverHead(*ctx)) {
        return 0;
    }
    if (!(*ctx->on_chunk)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

} // anonymous namespace

CurlHttpClient::CurlHttpClient(const CurlOptions& options)
    : options_(options) {
    ensureCurlInitialized();
}

std::optional<std::uint64_t> CurlHttpClient::parseContentRangeTotal(const std::string& value) {
    size_t slash = value.rfind('/');
    if (slash == std::string::npos || slash + 1 >= value.size()) {
        return std::nullopt;
    }
    std::string total = value.substr(slash + 1);
    if (!std::all_of(total.begin(), total.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoull(total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

HttpResult CurlHttpClient::get(const std::string& url,
                               std::uint64_t offset,
                               const HeadCallback& on_head,
                               const ChunkCallback& on_chunk) {
    HttpResult result;

    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        result.error = "Failed to allocate curl handle";
        return result;
    }

    RequestContext ctx;
    ctx.handle = curl.get();
    ctx.on_head = &on_head;
    ctx.on_chunk = &on_chunk;

    const std::string range = std::to_string(offset) + "-";

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    if (offset > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, options_.buffer_size);

    const CURLcode res = curl_easy_perform(curl.get());

    if (ctx.aborted) {
        result.aborted = true;
        result.error = "transfer aborted";
        return result;
    }
    if (res != CURLE_OK) {
        result.error = std::string{"curl error: "} + curl_easy_strerror(res);
        return result;
    }

    // Empty bodies never reach writeCallback
    if (!ctx.head_delivered && !deliverHead(ctx)) {
        result.aborted = true;
        result.error = "transfer aborted";
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace relayq
