// ==============================================================================
// archive.cpp - Распаковка gzip tarball с конфигами
// ==============================================================================
//
// libarchive: фильтр gzip и формат tar (ustar, GNU long name, pax).
// pax global header libarchive элементом не возвращает.
//
// ==============================================================================

#include "sgrep/archive.hpp"

#include "sgrep/platform.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <system_error>

namespace sgrep::archive {

namespace {

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

// ----------------------------------------------------------------------------
// RAII для archive_read
// ----------------------------------------------------------------------------

struct ReaderDeleter {
    void operator()(::archive* reader) const { archive_read_free(reader); }
};

using Reader = std::unique_ptr<::archive, ReaderDeleter>;

std::string reader_error(::archive* reader) {
    const char* message = archive_error_string(reader);
    return message != nullptr ? message : "unknown archive error";
}

Reader open_reader(std::string_view data, bool gzip) {
    Reader reader(archive_read_new());
    if (!reader) {
        throw ArchiveError("archive_read_new failed");
    }
    archive_read_support_format_tar(reader.get());
    if (gzip) {
        archive_read_support_filter_gzip(reader.get());
    }
    if (archive_read_open_memory(reader.get(), data.data(), data.size()) != ARCHIVE_OK) {
        throw ArchiveError("invalid archive data - " + reader_error(reader.get()));
    }
    return reader;
}

/// Имя элемента в UTF-8 (pax path, если есть)
std::string entry_name(archive_entry* entry) {
    const char* name = archive_entry_pathname_utf8(entry);
    if (name == nullptr) {
        name = archive_entry_pathname(entry);
    }
    return name != nullptr ? name : "";
}

/// Нормализовать имя элемента: убрать "./" и завершающий '/',
/// отвергнуть абсолютные пути и "..".
std::filesystem::path safe_member_path(const std::string& name) {
    std::filesystem::path raw = platform::path_from_utf8(name);
    if (raw.is_absolute() || raw.has_root_name() || raw.has_root_directory()) {
        throw ArchiveError("refusing to extract absolute path '" + name + "'");
    }

    std::filesystem::path clean;
    for (const auto& component : raw) {
        const std::string part = component.string();
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            throw ArchiveError("refusing to extract path outside archive root '" + name + "'");
        }
        clean /= component;
    }
    return clean;
}

void make_directories(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ArchiveError("failed to create directory " + platform::path_to_utf8(dir) + " - " +
                           ec.message());
    }
}

/// Скопировать данные текущего элемента в файл
void write_member(::archive* reader, const std::filesystem::path& target) {
    make_directories(target.parent_path());

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw ArchiveError("failed to create file " + platform::path_to_utf8(target));
    }

    std::array<char, CHUNK_SIZE> chunk;
    while (true) {
        la_ssize_t n = archive_read_data(reader, chunk.data(), chunk.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            throw ArchiveError("invalid archive data - " + reader_error(reader));
        }
        out.write(chunk.data(), static_cast<std::streamsize>(n));
        if (!out) {
            throw ArchiveError("failed to write file " + platform::path_to_utf8(target));
        }
    }
}

void skip_member(::archive* reader) {
    if (archive_read_data_skip(reader) != ARCHIVE_OK) {
        throw ArchiveError("invalid archive data - " + reader_error(reader));
    }
}

ExtractResult extract(std::string_view data, const std::filesystem::path& destination,
                      bool gzip) {
    Reader reader = open_reader(data, gzip);
    ExtractResult result;

    std::optional<std::filesystem::path> first_member;
    bool first_is_directory = false;

    archive_entry* entry = nullptr;
    while (true) {
        int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
            throw ArchiveError("invalid archive data - " + reader_error(reader.get()));
        }

        const std::string name = entry_name(entry);
        const std::filesystem::path member = safe_member_path(name);
        if (member.empty()) {
            skip_member(reader.get());
            continue;
        }

        const auto type = archive_entry_filetype(entry);
        const bool is_directory = type == AE_IFDIR;
        // Жёсткие ссылки приходят как AE_IFREG без данных
        const bool is_regular = type == AE_IFREG && archive_entry_hardlink(entry) == nullptr;

        if (!first_member) {
            first_member = member;
            // Элемент вложен в директорию верхнего уровня либо сам является ею
            first_is_directory = is_directory || std::distance(member.begin(), member.end()) > 1;
        }

        if (is_directory) {
            make_directories(destination / member);
            skip_member(reader.get());
            ++result.members;
        } else if (is_regular) {
            write_member(reader.get(), destination / member);
            ++result.members;
        } else {
            // Ссылки и устройства не распаковываются
            skip_member(reader.get());
        }
    }

    if (!first_member) {
        result.error = "archive contains no entries";
        return result;
    }

    const std::filesystem::path top = *first_member->begin();
    std::error_code ec;
    if (!first_is_directory || !std::filesystem::is_directory(destination / top, ec)) {
        result.error = "first archive entry '" + platform::path_to_utf8(top) +
                       "' is not a directory";
        return result;
    }

    result.ok = true;
    result.root = destination / top;
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// ScratchDirectory
// ----------------------------------------------------------------------------

ScratchDirectory::ScratchDirectory(std::string_view prefix)
    : path_(platform::make_temp_directory(prefix)) {}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

// ----------------------------------------------------------------------------
// tar
// ----------------------------------------------------------------------------

ExtractResult extract_tar(std::string_view tar, const std::filesystem::path& destination) {
    return extract(tar, destination, false);
}

ExtractResult extract_tar_gz(std::string_view compressed,
                             const std::filesystem::path& destination) {
    return extract(compressed, destination, true);
}

}  // namespace sgrep::archive
