// ==============================================================================
// http.cpp - HTTP транспорт (libcurl)
// ==============================================================================
//
// curl_global_init вызывается один раз на процесс, до первого easy handle.
// Каждый запрос использует собственный easy handle.
//
// ==============================================================================

#include "sgrep/http.hpp"

#include <cctype>
#include <memory>
#include <mutex>
#include <curl/curl.h>
#include <rapidjson/encodings.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/stringbuffer.h>

namespace sgrep::net {

namespace {

// ----------------------------------------------------------------------------
// Глобальная инициализация libcurl
// ----------------------------------------------------------------------------

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string to_lower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ----------------------------------------------------------------------------
// CurlHttpClient
// ----------------------------------------------------------------------------

CurlHttpClient::CurlHttpClient() {
    ensure_curl_global_init();
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResult CurlHttpClient::get(const std::string& url,
                               std::optional<std::chrono::milliseconds> timeout) {
    HttpResult result;

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        result.error = "curl_easy_init failed";
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &result.response.body);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "sgrep-lint");
    if (timeout) {
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout->count()));
    }

    CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        result.error = error_buffer[0] != '\0' ? std::string(error_buffer)
                                               : std::string(curl_easy_strerror(code));
        return result;
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &result.response.status);

    char* content_type = nullptr;
    if (curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
        content_type != nullptr) {
        result.response.content_type = content_type;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Content-Type
// ----------------------------------------------------------------------------

ContentKind classify_content_type(std::string_view content_type) {
    std::string_view media = content_type;
    std::size_t semicolon = media.find(';');
    if (semicolon != std::string_view::npos) {
        media = media.substr(0, semicolon);
    }
    const std::string normalized = to_lower(trim(media));

    if (normalized == "text/plain") {
        return ContentKind::PlainText;
    }
    if (normalized == "application/x-gzip" || normalized == "application/gzip") {
        return ContentKind::GzipArchive;
    }
    return ContentKind::Unrecognized;
}

bool is_url(std::string_view candidate) {
    std::size_t sep = candidate.find("://");
    if (sep == std::string_view::npos) {
        return false;
    }
    const std::string scheme = to_lower(candidate.substr(0, sep));
    if (scheme != "http" && scheme != "https") {
        return false;
    }
    std::string_view rest = candidate.substr(sep + 3);
    std::size_t host_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, host_end);
    std::size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    std::size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        authority = authority.substr(0, colon);
    }
    return !authority.empty();
}

bool is_valid_utf8(std::string_view body) {
    rapidjson::MemoryStream in(body.data(), body.size());
    rapidjson::StringBuffer sink;
    while (in.Tell() < body.size()) {
        if (!rapidjson::UTF8<>::Validate(in, sink)) {
            return false;
        }
        sink.Clear();
    }
    return true;
}

}  // namespace sgrep::net
