// ==============================================================================
// sgrep/platform.hpp - Платформенные абстракции и контекст выполнения
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Каталог временных файлов (TMPDIR)
// - Флаги окружения (docker / CI) и выбор базовой директории
//
// Платформенная специфика изолирована здесь: остальные модули не читают
// переменные окружения и не вызывают chdir.
//
// ==============================================================================

#ifndef SGREP_PLATFORM_HPP
#define SGREP_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace sgrep::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (argv, YAML, URL)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для id конфигов и сообщений)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные директории
// ----------------------------------------------------------------------------

/// Корень для временных директорий: $TMPDIR, иначе /tmp
std::filesystem::path temp_root();

/// Создать уникальную директорию <temp_root>/<prefix>XXXXXX (mkdtemp)
/// @throws std::runtime_error если директорию создать не удалось
std::filesystem::path make_temp_directory(std::string_view prefix);

// ----------------------------------------------------------------------------
// Контекст выполнения
// ----------------------------------------------------------------------------

/// Точка монтирования репозитория при запуске в контейнере
constexpr const char* REPO_HOME_DOCKER = "/home/repo/";

/// Флаги окружения, определяющие базовую директорию
struct EnvironmentFlags {
    bool in_docker = false;  // SGREP_IN_DOCKER задана
    bool in_ci = false;      // GITHUB_WORKSPACE задана
};

/// Прочитать флаги окружения (вызывается один раз из main)
EnvironmentFlags read_environment();

/// Контекст выполнения, передаваемый в resolver
struct ExecutionContext {
    /// Базовая директория для относительных спецификаторов
    std::filesystem::path base_path = ".";

    /// Запуск в контейнере (влияет только на текст ошибок)
    bool in_docker = false;
};

/// Результат выбора контекста
struct ContextResult {
    bool ok = false;
    ExecutionContext context;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Выбрать базовую директорию.
///
/// В контейнере (не CI, не precommit) база переключается на mount_point;
/// отсутствие mount_point в этом режиме - ошибка. Во всех прочих случаях
/// база остаётся ".".
ContextResult select_execution_context(const EnvironmentFlags& flags, bool precommit,
                                       const std::filesystem::path& mount_point = REPO_HOME_DOCKER);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace sgrep::platform

#endif  // SGREP_PLATFORM_HPP
