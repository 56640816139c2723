/**
 * @file transport.cpp
 * @brief libcurl transport for qwenchat
 */

#include "qwenchat/transport.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <algorithm>

namespace qwenchat {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

void lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* locks = static_cast<std::array<std::mutex, 8>*>(userptr);
    (*locks)[static_cast<size_t>(data) % locks->size()].lock();
}

void unlock_share(CURL*, curl_lock_data data, void* userptr) {
    auto* locks = static_cast<std::array<std::mutex, 8>*>(userptr);
    (*locks)[static_cast<size_t>(data) % locks->size()].unlock();
}

std::string cookie_header(const std::map<std::string, std::string>& cookies) {
    std::string result;
    for (const auto& [name, value] : cookies) {
        if (!result.empty()) result += "; ";
        result += name + "=" + value;
    }
    return result;
}

curl_slist* header_list(const std::map<std::string, std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [key, value] : headers) {
        list = curl_slist_append(list, (key + ": " + value).c_str());
    }
    return list;
}

struct StreamContext {
    CURL* curl;
    LineSplitter& splitter;
};

size_t stream_write(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<StreamContext*>(userp);
    size_t total = size * nmemb;

    if (ctx->splitter.status_code() == 0) {
        long status_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status_code);
        ctx->splitter.set_status(status_code);
    }

    return ctx->splitter.feed(static_cast<const char*>(contents), total) ? total : 0;
}

// Runs while the transfer waits for data; non-zero aborts it
int stream_progress(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(userp);
    return ctx->splitter.should_abort() ? 1 : 0;
}

} // namespace

LineSplitter::LineSplitter(LineHandler on_line, CancelCheck is_cancelled)
    : on_line_(std::move(on_line)),
      is_cancelled_(std::move(is_cancelled)),
      status_code_(0),
      cancelled_(false) {
}

bool LineSplitter::feed(const char* data, std::size_t size) {
    if (cancelled_ || error_) {
        return false;
    }

    if (status_code_ != 200) {
        if (error_body_.size() < STREAM_ERROR_BODY_LIMIT) {
            error_body_.append(data, std::min(size, STREAM_ERROR_BODY_LIMIT - error_body_.size()));
        }
        return true;
    }

    try {
        buffer_.append(data, size);

        // Process complete lines
        size_t start = 0;
        size_t pos;
        while ((pos = buffer_.find('\n', start)) != std::string::npos) {
            std::string line = buffer_.substr(start, pos - start);
            start = pos + 1;
            if (!deliver(std::move(line))) {
                buffer_.erase(0, start);
                return false;
            }
        }
        buffer_.erase(0, start);
    } catch (...) {
        // Held for the caller; nothing may unwind through libcurl
        error_ = std::current_exception();
        return false;
    }

    return true;
}

bool LineSplitter::finish() {
    if (cancelled_ || error_) {
        return false;
    }
    if (status_code_ != 200 || buffer_.empty()) {
        return true;
    }

    std::string line;
    line.swap(buffer_);
    try {
        return deliver(std::move(line));
    } catch (...) {
        error_ = std::current_exception();
        return false;
    }
}

bool LineSplitter::should_abort() {
    if (cancelled_ || error_) {
        return true;
    }
    if (is_cancelled_) {
        try {
            cancelled_ = is_cancelled_();
        } catch (...) {
            error_ = std::current_exception();
            return true;
        }
    }
    return cancelled_;
}

void LineSplitter::rethrow_if_failed() const {
    if (error_) {
        std::rethrow_exception(error_);
    }
}

bool LineSplitter::deliver(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (should_abort()) {
        return false;
    }
    if (!on_line_(line)) {
        cancelled_ = true;
        return false;
    }
    return true;
}

CreateConversationResult interpret_create_conversation_response(long status_code, const std::string& body) {
    CreateConversationResult result;

    auto fail = [&](const std::string& message) {
        TransportFailure failure;
        failure.status_code = status_code;
        failure.message = message;
        failure.body_excerpt = truncate(body, CREATE_ERROR_BODY_LIMIT);
        result.failure = failure;
        return result;
    };

    if (status_code != 200) {
        return fail("HTTP " + std::to_string(status_code));
    }

    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return fail("Response is not a JSON object");
    }

    auto success = data.find("success");
    if (success == data.end() || !success->is_boolean() || !success->get<bool>()) {
        return fail("Response did not report success");
    }

    auto payload = data.find("data");
    if (payload == data.end() || !payload->is_object()) {
        return fail("Response has no data");
    }
    auto id = payload->find("id");
    if (id == payload->end() || !id->is_string() || id->get<std::string>().empty()) {
        return fail("Response has no conversation id");
    }

    result.conversation_id = id->get<std::string>();
    return result;
}

CurlTransport::CurlTransport(const TransportOptions& options)
    : options_(options),
      share_(nullptr) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    CURLSH* share = curl_share_init();
    if (share) {
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, lock_share);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, unlock_share);
        curl_share_setopt(share, CURLSHOPT_USERDATA, &share_locks_);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    } else {
        spdlog::warn("curl_share_init failed; connections will not be reused");
    }
    share_ = share;
}

CurlTransport::~CurlTransport() {
    if (share_) {
        curl_share_cleanup(static_cast<CURLSH*>(share_));
    }
    curl_global_cleanup();
}

CreateConversationResult CurlTransport::create_conversation(
    const RequestContext& context,
    const json& payload
) {
    std::string url = context.base_url + QWEN_NEW_CHAT_PATH;

    CURL* curl = curl_easy_init();
    if (!curl) {
        CreateConversationResult result;
        result.failure = TransportFailure{0, "Failed to initialize CURL", ""};
        return result;
    }

    std::string request_body = payload.dump();
    std::string response;
    std::string cookies = cookie_header(context.cookies);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.request_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    if (!cookies.empty()) {
        curl_easy_setopt(curl, CURLOPT_COOKIE, cookies.c_str());
    }
    if (share_) {
        curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
    }

    curl_slist* headers = header_list(context.headers);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        CreateConversationResult result;
        result.failure = TransportFailure{
            http_code,
            "CURL error: " + std::string(curl_easy_strerror(res)),
            truncate(response, CREATE_ERROR_BODY_LIMIT)
        };
        return result;
    }

    return interpret_create_conversation_response(http_code, response);
}

StreamResult CurlTransport::stream_chat_turn(
    const RequestContext& context,
    const std::string& conversation_id,
    const json& payload,
    const LineHandler& on_line,
    const CancelCheck& is_cancelled
) {
    StreamResult result;
    std::string url = context.base_url + QWEN_COMPLETIONS_PATH + "?chat_id=";

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.failure = TransportFailure{0, "Failed to initialize CURL", ""};
        return result;
    }

    char* escaped = curl_easy_escape(curl, conversation_id.c_str(), static_cast<int>(conversation_id.length()));
    if (escaped) {
        url += escaped;
        curl_free(escaped);
    } else {
        url += conversation_id;
    }

    std::string request_body = payload.dump();
    std::string cookies = cookie_header(context.cookies);

    LineSplitter splitter(on_line, is_cancelled);
    StreamContext ctx{curl, splitter};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, stream_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    // Abort a stalled stream: under 1 byte/s for the read timeout
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.read_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (!cookies.empty()) {
        curl_easy_setopt(curl, CURLOPT_COOKIE, cookies.c_str());
    }
    if (share_) {
        curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
    }

    curl_slist* headers = header_list(context.headers);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    splitter.rethrow_if_failed();

    result.status_code = http_code;

    if (splitter.cancelled() || res == CURLE_ABORTED_BY_CALLBACK) {
        result.cancelled = true;
        return result;
    }

    if (res != CURLE_OK) {
        result.failure = TransportFailure{
            http_code,
            "CURL error: " + std::string(curl_easy_strerror(res)),
            splitter.error_body()
        };
        return result;
    }

    if (http_code != 200) {
        result.failure = TransportFailure{
            http_code,
            "Request failed: " + std::to_string(http_code),
            splitter.error_body()
        };
        return result;
    }

    // Trailing line without a terminator
    if (!splitter.finish()) {
        splitter.rethrow_if_failed();
        result.cancelled = true;
    }

    return result;
}

} // namespace qwenchat
