#include "driftwatch/specification.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include <nlohmann/json.hpp>
#include <fnmatch.h>
#include <fstream>
#include <sstream>

namespace driftwatch {

using nlohmann::json;

std::string to_string(ElementKind kind) {
    switch (kind) {
        case ElementKind::Function:   return "function";
        case ElementKind::Type:       return "type";
        case ElementKind::Dependency: return "dependency";
    }
    return "function";
}

std::optional<ElementKind> element_kind_from_string(const std::string& text) {
    if (text == "function" || text == "method") return ElementKind::Function;
    if (text == "type" || text == "class") return ElementKind::Type;
    if (text == "dependency") return ElementKind::Dependency;
    return std::nullopt;
}

const ExpectedElement* Specification::find(const std::string& id) const {
    for (const auto& element : elements) {
        if (element.id == id) {
            return &element;
        }
    }
    return nullptr;
}

bool path_matches(const std::string& relative_path, const std::string& pattern) {
    if (pattern.find('/') != std::string::npos) {
        return fnmatch(pattern.c_str(), relative_path.c_str(), 0) == 0;
    }
    std::string name = std::filesystem::path(relative_path).filename().string();
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

// Helper to read a whole file into a string
static std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return {};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

static ExpectedElement parse_element(const json& j) {
    ExpectedElement element;
    element.id = j.at("id").get<std::string>();
    auto kind = element_kind_from_string(j.value("kind", std::string("function")));
    if (!kind) {
        throw SpecLoadError("Unknown element kind for '" + element.id + "'");
    }
    element.kind = *kind;
    element.signature = j.value("signature", std::string());
    element.behavior_hash = j.value("behavior_hash", std::string());
    element.description = j.value("description", std::string());
    element.doc_hash = j.value("doc_hash", std::string());
    element.is_breaking_if_removed = j.value("breaking", false);
    return element;
}

SpecificationCatalog::SpecificationCatalog(const std::string& catalog_path)
    : catalog_path_(catalog_path)
{
}

void SpecificationCatalog::load() {
    std::string content = read_file(catalog_path_);
    if (content.empty()) {
        throw SpecLoadError("Failed to read specification catalog: " + catalog_path_);
    }
    try {
        last_modified_ = std::filesystem::last_write_time(catalog_path_);
    } catch (const std::filesystem::filesystem_error& e) {
        throw SpecLoadError(std::string("Failed to stat specification catalog: ") + e.what());
    }
    load_from_string(content);
    Logger::info("Loaded ", size(), " specification(s) from ", catalog_path_);
}

void SpecificationCatalog::load_from_string(const std::string& json_text) {
    std::vector<Entry> entries;
    try {
        json root = json::parse(json_text);
        for (const auto& item : root.at("specifications")) {
            auto spec = std::make_shared<Specification>();
            spec->name = item.at("name").get<std::string>();
            spec->source_ref = item.value("source_ref", spec->name);
            spec->revision = item.value("revision", std::string());
            if (item.contains("elements")) {
                for (const auto& element : item.at("elements")) {
                    spec->elements.push_back(parse_element(element));
                }
            }

            Entry entry;
            entry.patterns = item.value("paths", std::vector<std::string>{});
            entry.spec = std::move(spec);
            entries.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        throw SpecLoadError(std::string("Malformed specification catalog: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(entries);
}

bool SpecificationCatalog::check_and_reload() {
    if (catalog_path_.empty()) {
        return false;
    }
    try {
        auto current_time = std::filesystem::last_write_time(catalog_path_);
        if (current_time != last_modified_) {
            load();
            return true;
        }
    } catch (const std::exception& e) {
        Logger::warning("Error reloading specification catalog: ", e.what());
    }
    return false;
}

void SpecificationCatalog::add(const std::vector<std::string>& path_patterns, Specification spec) {
    Entry entry;
    entry.patterns = path_patterns;
    entry.spec = std::make_shared<const Specification>(std::move(spec));

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

std::shared_ptr<const Specification> SpecificationCatalog::find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        for (const auto& pattern : entry.patterns) {
            if (path_matches(path, pattern)) {
                return entry.spec;
            }
        }
    }
    return nullptr;
}

size_t SpecificationCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

SignatureIndex::SignatureIndex(const std::string& index_path)
    : index_path_(index_path)
{
}

void SignatureIndex::reload_if_changed() {
    std::filesystem::file_time_type current_time;
    try {
        current_time = std::filesystem::last_write_time(index_path_);
    } catch (const std::filesystem::filesystem_error& e) {
        throw ScanError(index_path_, std::string("signature index unavailable: ") + e.what());
    }
    if (loaded_ && current_time == last_modified_) {
        return;
    }

    std::string content = read_file(index_path_);
    std::map<std::string, SignatureSet> files;
    try {
        json root = json::parse(content);
        for (const auto& [file, symbols] : root.at("files").items()) {
            SignatureSet set;
            for (const auto& [id, observed] : symbols.items()) {
                ObservedSignature sig;
                sig.signature = observed.value("signature", std::string());
                sig.behavior_hash = observed.value("behavior_hash", std::string());
                if (observed.contains("line")) {
                    sig.line_number = observed.at("line").get<int>();
                }
                set.emplace(id, std::move(sig));
            }
            files.emplace(file, std::move(set));
        }
    } catch (const json::exception& e) {
        throw ScanError(index_path_, std::string("malformed signature index: ") + e.what());
    }

    files_ = std::move(files);
    last_modified_ = current_time;
    loaded_ = true;
    Logger::debug("Signature index reloaded: ", files_.size(), " file(s)");
}

SignatureSet SignatureIndex::extract(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload_if_changed();
    auto it = files_.find(path);
    if (it == files_.end()) {
        return {};
    }
    return it->second;
}

} // namespace driftwatch
