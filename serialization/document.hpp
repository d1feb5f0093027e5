#ifndef CHROMAMAP_SERIALIZATION_DOCUMENT_HPP
#define CHROMAMAP_SERIALIZATION_DOCUMENT_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace chromamap::json {

// Readers accept any document with the same major version
constexpr int FORMAT_MAJOR = 1;
constexpr const char* FORMAT_VERSION = "1.0";

enum class DocumentKind { Puzzle, Report };

inline std::string kind_name(DocumentKind kind) {
    return kind == DocumentKind::Puzzle ? "puzzle" : "report";
}

inline DocumentKind kind_from_name(const std::string& name) {
    if (name == "puzzle") return DocumentKind::Puzzle;
    if (name == "report") return DocumentKind::Report;
    throw std::runtime_error("Unknown document kind: '" + name + "'");
}

// Leading integer of "major.minor"
inline int major_version(const std::string& format) {
    size_t digits = 0;
    while (digits < format.size() && format[digits] >= '0' && format[digits] <= '9') {
        ++digits;
    }
    if (digits == 0 || (digits < format.size() && format[digits] != '.')) {
        throw std::runtime_error("Malformed document format '" + format + "'");
    }
    return std::stoi(format.substr(0, digits));
}

// Current UTC time, ISO 8601
inline std::string utc_now() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
    gmtime_r(&time, &parts);
    std::ostringstream oss;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// A puzzle written by `generate`, or the report `solve` computes for one.
// settings holds what produced the payload, summary a few headline numbers.
struct Document {
    std::string format = FORMAT_VERSION;
    DocumentKind kind = DocumentKind::Puzzle;
    std::string created;
    std::string source;
    nlohmann::json settings;
    nlohmann::json summary;
    nlohmann::json payload;

    static Document create(DocumentKind kind, nlohmann::json payload) {
        Document doc;
        doc.kind = kind;
        doc.created = utc_now();
        doc.payload = std::move(payload);
        return doc;
    }
};

inline void to_json(nlohmann::json& j, const Document& doc) {
    j = {{"format", doc.format}, {"kind", kind_name(doc.kind)}};
    if (!doc.created.empty()) j["created"] = doc.created;
    if (!doc.source.empty()) j["source"] = doc.source;
    if (!doc.settings.is_null()) j["settings"] = doc.settings;
    if (!doc.summary.is_null()) j["summary"] = doc.summary;
    j["payload"] = doc.payload;
}

// Throws std::runtime_error when kind or payload is missing, or the
// format has a different major version
inline void from_json(const nlohmann::json& j, Document& doc) {
    if (!j.is_object() || !j.contains("kind") || !j.contains("payload")) {
        throw std::runtime_error("Not a chromamap document: kind and payload are required");
    }
    doc.format = j.value("format", std::string(FORMAT_VERSION));
    if (major_version(doc.format) != FORMAT_MAJOR) {
        throw std::runtime_error("Unsupported document format " + doc.format +
                                 " (this build reads " + std::to_string(FORMAT_MAJOR) + ".x)");
    }
    doc.kind = kind_from_name(j["kind"].get<std::string>());
    doc.created = j.value("created", "");
    doc.source = j.value("source", "");
    doc.settings = j.value("settings", nlohmann::json());
    doc.summary = j.value("summary", nlohmann::json());
    doc.payload = j["payload"];
}

inline void write_json(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
}

inline nlohmann::json read_json(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

// Reads a document and checks it holds the expected kind
inline Document read_document(const std::string& path, DocumentKind expected) {
    Document doc = read_json(path).get<Document>();
    if (doc.kind != expected) {
        throw std::runtime_error(path + " holds a " + kind_name(doc.kind) +
                                 ", expected a " + kind_name(expected));
    }
    return doc;
}

}  // namespace chromamap::json

#endif // CHROMAMAP_SERIALIZATION_DOCUMENT_HPP
