// ==============================================================================
// sgrep/archive.hpp - Распаковка gzip tarball с конфигами
// ==============================================================================
//
// Назначение:
// - Чтение gzip + ustar / GNU / pax архивов через libarchive
// - Распаковка на диск с отказом от небезопасных путей
// - Временная директория с гарантированным удалением (RAII)
// - Выбор корня обхода: первый элемент верхнего уровня в порядке архива
//
// ==============================================================================

#ifndef SGREP_ARCHIVE_HPP
#define SGREP_ARCHIVE_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sgrep::archive {

// ----------------------------------------------------------------------------
// ArchiveError - повреждённые данные или сбой записи на диск
// ----------------------------------------------------------------------------

class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& message) : std::runtime_error(message) {}
};

// ----------------------------------------------------------------------------
// ScratchDirectory - уникальная временная директория одного вызова
// ----------------------------------------------------------------------------

/// Создаёт <temp_root>/<prefix>XXXXXX и рекурсивно удаляет её в деструкторе.
/// Каждый вызов получает собственную директорию: параллельные загрузки одного
/// URL не конфликтуют.
class ScratchDirectory {
public:
    /// @throws std::runtime_error если директорию создать не удалось
    explicit ScratchDirectory(std::string_view prefix = "sgrep-config-");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ----------------------------------------------------------------------------
// tar
// ----------------------------------------------------------------------------

/// Результат распаковки
struct ExtractResult {
    bool ok = false;

    /// Директория верхнего уровня, ставшая корнем обхода
    std::filesystem::path root;

    /// Число распакованных элементов (файлы и директории)
    std::size_t members = 0;

    /// Описание ошибки структуры архива (ok == false)
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Распаковать tar в destination полностью, затем выбрать корень обхода.
///
/// Корень - первый компонент верхнего уровня первого элемента архива
/// (pax global header не считается элементом). Пустой архив или первый
/// элемент-файл на верхнем уровне дают ok == false.
///
/// @throws ArchiveError при повреждённых данных, небезопасном пути
///         (абсолютный или с "..") или ошибке записи
ExtractResult extract_tar(std::string_view tar, const std::filesystem::path& destination);

/// То же для tar, сжатого gzip (склеенные gzip члены допускаются)
ExtractResult extract_tar_gz(std::string_view compressed, const std::filesystem::path& destination);

}  // namespace sgrep::archive

#endif  // SGREP_ARCHIVE_HPP
