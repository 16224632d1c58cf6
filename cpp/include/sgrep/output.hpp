// ==============================================================================
// sgrep/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// RapidJSON для JSON сериализации
// Только этот модуль пишет в stdout/stderr
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) для TTY
// - JSON вывод набора конфигов
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef SGREP_OUTPUT_HPP
#define SGREP_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace sgrep::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// Информационное сообщение в stderr (если не quiet): "[+] <message>"
    void info(std::string_view message);

    /// Предупреждение в stderr (если не quiet): "[!] <message>"
    void warn(std::string_view message);

    /// Ошибка в stderr (всегда): "[x] <message>"
    void error(std::string_view message);

    /// Отладочное сообщение (только при verbose > 0): "[*] <message>"
    void debug(std::string_view message);

    /// Трассировка (только при verbose > 1): "[~] <message>"
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать компактный JSON в stdout
    void write_json(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

    /// Проверить, открыт ли файл для вывода
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    bool open_output_file();
    void close_output_file();

    /// Префикс сообщения с цветом (при TTY)
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// Добавить табуляцию перед каждой строкой (диагностика парсера)
std::string indent(std::string_view message);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace sgrep::output

#endif  // SGREP_OUTPUT_HPP
