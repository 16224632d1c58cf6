// ==============================================================================
// platform.cpp - Платформенные абстракции и контекст выполнения
// ==============================================================================

#include "sgrep/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace sgrep::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Временные директории
// ----------------------------------------------------------------------------

std::filesystem::path temp_root() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && tmpdir[0] != '\0') {
        return std::filesystem::path(tmpdir);
    }
#ifdef _WIN32
    return std::filesystem::temp_directory_path();
#else
    return std::filesystem::path("/tmp");
#endif
}

std::filesystem::path make_temp_directory(std::string_view prefix) {
#ifdef _WIN32
    // Windows: mkdtemp нет, перебираем случайные суффиксы
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = temp_root() / (std::string(prefix) + std::to_string(GetTickCount64()) +
                                        "_" + std::to_string(attempt));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate;
        }
    }
    throw std::runtime_error("Failed to create temp directory");
#else
    std::string tmpl = path_to_utf8(temp_root() / (std::string(prefix) + "XXXXXX"));
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    if (mkdtemp(tmpl_buf.data()) == nullptr) {
        throw std::runtime_error("Failed to create temp directory " + tmpl + " - " +
                                 std::strerror(errno));
    }

    return std::filesystem::path(tmpl_buf.data());
#endif
}

// ----------------------------------------------------------------------------
// Контекст выполнения
// ----------------------------------------------------------------------------

EnvironmentFlags read_environment() {
    EnvironmentFlags flags;
    flags.in_docker = std::getenv("SGREP_IN_DOCKER") != nullptr;
    flags.in_ci = std::getenv("GITHUB_WORKSPACE") != nullptr;
    return flags;
}

ContextResult select_execution_context(const EnvironmentFlags& flags, bool precommit,
                                       const std::filesystem::path& mount_point) {
    ContextResult result;
    result.context.in_docker = flags.in_docker;

    if (flags.in_docker && !flags.in_ci && !precommit) {
        std::error_code ec;
        if (!std::filesystem::is_directory(mount_point, ec)) {
            result.error =
                "you are running sgrep in docker, but you forgot to mount the current directory "
                "in Docker: missing: -v \"${PWD}:" +
                path_to_utf8(mount_point) + "\"";
            return result;
        }
        result.context.base_path = mount_point;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace sgrep::platform
