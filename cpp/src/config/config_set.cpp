// ==============================================================================
// config_set.cpp - Ошибки разрешения конфигов
// ==============================================================================

#include <sgrep/config_set.hpp>

#include <sstream>

namespace sgrep::config {

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedContentType:
        return "unsupported content type";
    case ErrorKind::BadHttpStatus:
        return "bad http status";
    case ErrorKind::InvalidLocationType:
        return "invalid location type";
    case ErrorKind::LocationNotFound:
        return "location not found";
    case ErrorKind::ArchiveLayout:
        return "archive layout";
    case ErrorKind::TemplateExists:
        return "template exists";
    case ErrorKind::TemplateWrite:
        return "template write";
    }
    return "unknown";
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!location.empty()) {
        oss << " [" << location << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::size_t count_absent(const ConfigSet& configs) {
    std::size_t absent = 0;
    for (const auto& [id, document] : configs) {
        if (!document.has_value()) {
            ++absent;
        }
    }
    return absent;
}

rapidjson::Document to_json(const ConfigSet& configs) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    for (const auto& [id, document] : configs) {
        rapidjson::Value key(id.c_str(), static_cast<rapidjson::SizeType>(id.size()), alloc);
        rapidjson::Value value;
        if (document) {
            document->to_rapidjson(value, alloc);
        }
        doc.AddMember(key, value, alloc);
    }
    return doc;
}

}  // namespace sgrep::config
