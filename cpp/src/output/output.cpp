// ==============================================================================
// output.cpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// RapidJSON для JSON сериализации
// Байты первичны, std::endl не используется
//
// ==============================================================================

#include "sgrep/output.hpp"

#include "sgrep/platform.hpp"

#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace sgrep::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

std::string format_prefixed(std::string_view prefix, std::string_view message) {
    std::string result;
    result.reserve(prefix.size() + message.size() + 2);
    result.append(prefix);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout при открытом output file уходит в файл
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write(Stream::Stderr, " ");
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+]", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!]", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefix("[x]", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*]", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~]", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return format_prefixed("[+]", message);
}

std::string format_error(std::string_view message) {
    return format_prefixed("[x]", message);
}

std::string indent(std::string_view message) {
    // Хвостовой перевод строки не порождает пустую строку
    std::string result;
    std::size_t start = 0;
    while (start < message.size()) {
        std::size_t end = message.find('\n', start);
        if (end == std::string_view::npos) {
            end = message.size();
        }
        std::string_view line = message.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += '\t';
        result.append(line);
        start = end + 1;
    }
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    } else {
        return platform::is_tty_stderr();
    }
}

}  // namespace sgrep::output
