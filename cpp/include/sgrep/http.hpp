// ==============================================================================
// sgrep/http.hpp - HTTP транспорт для загрузки конфигов
// ==============================================================================
//
// Назначение:
// - Абстракция HttpClient (подменяется в тестах)
// - CurlHttpClient: блокирующий GET через libcurl
// - Классификация Content-Type ответа
//
// ==============================================================================

#ifndef SGREP_HTTP_HPP
#define SGREP_HTTP_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace sgrep::net {

// ----------------------------------------------------------------------------
// Ответ и результат запроса
// ----------------------------------------------------------------------------

struct HttpResponse {
    long status = 0;
    std::string content_type;  // пусто, если заголовок отсутствует
    std::string body;

    /// Статус 2xx
    bool is_success() const { return status >= 200 && status < 300; }
};

/// Результат запроса: ok == false означает сбой транспорта
/// (DNS, соединение, TLS, обрыв), а не HTTP статус
struct HttpResult {
    bool ok = false;
    HttpResponse response;
    std::string error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// HttpClient
// ----------------------------------------------------------------------------

class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Блокирующий GET. timeout == nullopt: без ограничения времени.
    virtual HttpResult get(const std::string& url,
                           std::optional<std::chrono::milliseconds> timeout) = 0;
};

/// libcurl реализация: следует редиректам, тело целиком в памяти
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResult get(const std::string& url,
                   std::optional<std::chrono::milliseconds> timeout) override;
};

// ----------------------------------------------------------------------------
// Content-Type
// ----------------------------------------------------------------------------

enum class ContentKind { PlainText, GzipArchive, Unrecognized };

/// Классифицировать значение Content-Type.
/// Параметры (";charset=...") отбрасываются, сравнение без учёта регистра:
/// text/plain -> PlainText; application/x-gzip, application/gzip -> GzipArchive.
ContentKind classify_content_type(std::string_view content_type);

/// URL: схема http/https, "://" и непустой host
bool is_url(std::string_view candidate);

/// Тело ответа text/plain - корректный UTF-8
bool is_valid_utf8(std::string_view body);

}  // namespace sgrep::net

#endif  // SGREP_HTTP_HPP
