#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace driftwatch {

enum class ElementKind {
    Function,
    Type,
    Dependency
};

std::string to_string(ElementKind kind);
std::optional<ElementKind> element_kind_from_string(const std::string& text);

struct ExpectedElement {
    std::string id;
    ElementKind kind = ElementKind::Function;
    std::string signature;              // For dependencies: the required version
    std::string behavior_hash;
    std::string description;
    std::string doc_hash;
    bool is_breaking_if_removed = false; // Public API; removal or change breaks callers
};

struct Specification {
    std::string name;
    std::string source_ref;
    std::string revision;
    std::vector<ExpectedElement> elements;

    const ExpectedElement* find(const std::string& id) const;
};

struct ObservedSignature {
    std::string signature;
    std::string behavior_hash;
    std::optional<int> line_number;
};

// Keyed by element id; ordered so iteration is deterministic
using SignatureSet = std::map<std::string, ObservedSignature>;

// Supplies the specification governing a project-relative path
class SpecificationProvider {
public:
    virtual ~SpecificationProvider() = default;

    // nullptr when no specification covers the path; throws SpecLoadError
    // when one should exist but cannot be produced
    virtual std::shared_ptr<const Specification> find(const std::string& path) const = 0;
};

// Supplies the current signatures of a project-relative path
class SignatureExtractor {
public:
    virtual ~SignatureExtractor() = default;
    virtual SignatureSet extract(const std::string& path) = 0;
};

// Glob match used for spec paths and watch/ignore patterns. Patterns with a
// '/' are matched against the whole relative path, others against the file
// name.
bool path_matches(const std::string& relative_path, const std::string& pattern);

// Loads normalized specifications from a JSON catalog:
// {"specifications": [{"name", "source_ref", "revision", "paths": [...],
//   "elements": [{"id", "kind", "signature", "behavior_hash", "description",
//                 "doc_hash", "breaking"}]}]}
class SpecificationCatalog : public SpecificationProvider {
public:
    SpecificationCatalog() = default;
    explicit SpecificationCatalog(const std::string& catalog_path);

    // Throws SpecLoadError on unreadable or malformed catalogs
    void load();
    void load_from_string(const std::string& json_text);

    // Reload if file changed
    bool check_and_reload();

    void add(const std::vector<std::string>& path_patterns, Specification spec);

    std::shared_ptr<const Specification> find(const std::string& path) const override;
    size_t size() const;

private:
    struct Entry {
        std::vector<std::string> patterns;
        std::shared_ptr<const Specification> spec;
    };

    std::string catalog_path_;
    std::filesystem::file_time_type last_modified_{};
    std::vector<Entry> entries_;
    mutable std::mutex mutex_;
};

// Reads signatures from a JSON index written by an external analyzer:
// {"files": {"<relative path>": {"<id>": {"signature", "behavior_hash", "line"}}}}
class SignatureIndex : public SignatureExtractor {
public:
    explicit SignatureIndex(const std::string& index_path);

    // Throws ScanError if the index cannot be read
    SignatureSet extract(const std::string& path) override;

private:
    void reload_if_changed();

    std::string index_path_;
    std::filesystem::file_time_type last_modified_{};
    bool loaded_ = false;
    std::map<std::string, SignatureSet> files_;
    std::mutex mutex_;
};

} // namespace driftwatch
