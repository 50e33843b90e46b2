/*
 * Sequence: SEQ0016
 * Track: C++
 * MVP: mvp1
 * Change: Implement Bot API calls with a reused curl handle and map API replies onto TransportError and FloodWait.
 * Tests: test_telegram_transport
 */
#include "tglogger/telegram_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <sstream>

namespace tglogger {

namespace {

constexpr std::size_t kMaxErrorBodyLength = 256;
constexpr long kTooManyRequests = 429;

std::once_flag g_curl_init_flag;
CURLcode g_curl_init_result = CURLE_OK;

void ensure_curl_initialized() {
    // curl_global_cleanup is left to process exit; other code in the host
    // process may still be using libcurl.
    std::call_once(g_curl_init_flag, []() { g_curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (g_curl_init_result != CURLE_OK) {
        throw TransportError(0, std::string("curl_global_init failed: ") + curl_easy_strerror(g_curl_init_result));
    }
}

class CurlHeaderGuard {
public:
    explicit CurlHeaderGuard(curl_slist *list) : list_(list) {}
    ~CurlHeaderGuard() {
        if (list_ != nullptr) {
            curl_slist_free_all(list_);
        }
    }

    CurlHeaderGuard(const CurlHeaderGuard &) = delete;
    CurlHeaderGuard &operator=(const CurlHeaderGuard &) = delete;

    curl_slist *get() const { return list_; }

private:
    curl_slist *list_;
};

class CurlMimeGuard {
public:
    explicit CurlMimeGuard(curl_mime *mime) : mime_(mime) {}
    ~CurlMimeGuard() {
        if (mime_ != nullptr) {
            curl_mime_free(mime_);
        }
    }

    CurlMimeGuard(const CurlMimeGuard &) = delete;
    CurlMimeGuard &operator=(const CurlMimeGuard &) = delete;

    curl_mime *get() const { return mime_; }

private:
    curl_mime *mime_;
};

std::size_t append_body(char *data, std::size_t size, std::size_t count, void *userdata) {
    std::string *body = static_cast<std::string *>(userdata);
    body->append(data, size * count);
    return size * count;
}

std::string write_json(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool parse_json(const std::string &body, Json::Value &root) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    return reader->parse(body.data(), body.data() + body.size(), &root, &errors);
}

std::string truncate_body(const std::string &body) {
    if (body.size() <= kMaxErrorBodyLength) {
        return body;
    }
    return body.substr(0, kMaxErrorBodyLength) + "...";
}

void add_text_part(curl_mime *mime, const char *name, const std::string &value) {
    curl_mimepart *part = curl_mime_addpart(mime);
    if (part == nullptr) {
        throw TransportError(0, "failed to allocate multipart field");
    }
    curl_mime_name(part, name);
    curl_mime_data(part, value.data(), value.size());
}

} // namespace

namespace bot_api {

std::string method_url(const std::string &base_url, const std::string &token, const std::string &method) {
    std::string url = base_url;
    url += "/bot";
    url += token;
    url += '/';
    url += method;
    return url;
}

Json::Value build_send_message(std::int64_t chat_id, std::int64_t topic_id, const std::string &text) {
    Json::Value payload(Json::objectValue);
    payload["chat_id"] = Json::Int64(chat_id);
    if (topic_id > 0) {
        payload["message_thread_id"] = Json::Int64(topic_id);
    }
    payload["text"] = text;
    payload["parse_mode"] = kParseMode;
    payload["disable_web_page_preview"] = true;
    return payload;
}

Json::Value build_edit_message(std::int64_t chat_id, std::int64_t message_id, const std::string &text) {
    Json::Value payload(Json::objectValue);
    payload["chat_id"] = Json::Int64(chat_id);
    payload["message_id"] = Json::Int64(message_id);
    payload["text"] = text;
    payload["parse_mode"] = kParseMode;
    payload["disable_web_page_preview"] = true;
    return payload;
}

Json::Value interpret_response(long http_status, const std::string &body) {
    Json::Value root;
    if (!parse_json(body, root) || !root.isObject()) {
        if (http_status == kTooManyRequests) {
            throw FloodWait(std::chrono::seconds(1), truncate_body(body));
        }
        throw TransportError(http_status, "unexpected reply: " + truncate_body(body));
    }

    if (root.get("ok", false).asBool()) {
        return root["result"];
    }

    const std::string description = root.get("description", "").asString();
    const Json::Value &parameters = root["parameters"];
    if (parameters.isObject() && parameters.isMember("retry_after")) {
        const Json::Value &retry_after = parameters["retry_after"];
        const long long seconds = retry_after.isIntegral() ? retry_after.asInt64() : 1;
        throw FloodWait(std::chrono::seconds(seconds), description);
    }
    if (http_status == kTooManyRequests) {
        throw FloodWait(std::chrono::seconds(1), description);
    }

    long status = http_status;
    if (root.isMember("error_code") && root["error_code"].isIntegral()) {
        status = static_cast<long>(root["error_code"].asInt64());
    }
    throw TransportError(status, description.empty() ? truncate_body(body) : description);
}

std::int64_t message_id_of(const Json::Value &result) {
    if (!result.isObject() || !result.isMember("message_id") || !result["message_id"].isIntegral()) {
        throw TransportError(0, "reply carries no message_id");
    }
    return static_cast<std::int64_t>(result["message_id"].asInt64());
}

} // namespace bot_api

TelegramTransport::TelegramTransport(const HandlerConfig &config)
    : base_url_(config.api_base_url),
      token_(config.token),
      chat_id_(config.chat_id),
      topic_id_(config.topic_id),
      timeout_(config.request_timeout),
      curl_(nullptr) {
    ensure_curl_initialized();
    curl_ = curl_easy_init();
    if (curl_ == nullptr) {
        throw TransportError(0, "curl_easy_init failed");
    }
}

TelegramTransport::~TelegramTransport() {
    if (curl_ != nullptr) {
        curl_easy_cleanup(static_cast<CURL *>(curl_));
        curl_ = nullptr;
    }
}

std::int64_t TelegramTransport::send_message(const std::string &text) {
    const Json::Value result = post_json("sendMessage", bot_api::build_send_message(chat_id_, topic_id_, text));
    return bot_api::message_id_of(result);
}

void TelegramTransport::edit_message(std::int64_t message_id, const std::string &text) {
    post_json("editMessageText", bot_api::build_edit_message(chat_id_, message_id, text));
}

std::int64_t TelegramTransport::send_file(const std::string &filename,
                                          const std::string &content,
                                          const std::string &caption) {
    CURL *curl = static_cast<CURL *>(curl_);
    curl_easy_reset(curl);

    CurlMimeGuard mime(curl_mime_init(curl));
    if (mime.get() == nullptr) {
        throw TransportError(0, "failed to allocate multipart body");
    }

    add_text_part(mime.get(), "chat_id", std::to_string(chat_id_));
    if (topic_id_ > 0) {
        add_text_part(mime.get(), "message_thread_id", std::to_string(topic_id_));
    }
    add_text_part(mime.get(), "caption", caption);

    curl_mimepart *document = curl_mime_addpart(mime.get());
    if (document == nullptr) {
        throw TransportError(0, "failed to allocate multipart document");
    }
    curl_mime_name(document, "document");
    curl_mime_filename(document, filename.c_str());
    curl_mime_type(document, "text/plain");
    curl_mime_data(document, content.data(), content.size());

    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime.get());
    return bot_api::message_id_of(perform("sendDocument"));
}

Json::Value TelegramTransport::post_json(const std::string &method, const Json::Value &payload) {
    CURL *curl = static_cast<CURL *>(curl_);
    curl_easy_reset(curl);

    const std::string body = write_json(payload);
    CurlHeaderGuard headers(curl_slist_append(nullptr, "Content-Type: application/json"));
    if (headers.get() == nullptr) {
        throw TransportError(0, "failed to allocate request headers");
    }

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    return perform(method);
}

Json::Value TelegramTransport::perform(const std::string &method) {
    CURL *curl = static_cast<CURL *>(curl_);
    const std::string url = bot_api::method_url(base_url_, token_, method);

    std::string response;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    const CURLcode code = curl_easy_perform(curl);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << method << ": " << (error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code));
        throw TransportError(0, oss.str());
    }

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    return bot_api::interpret_response(http_status, response);
}

} // namespace tglogger
