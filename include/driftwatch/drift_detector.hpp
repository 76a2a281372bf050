#pragma once

#include "driftwatch/specification.hpp"
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace driftwatch {

enum class DriftType {
    MissingImplementation,
    SignatureMismatch,
    BehaviorDeviation,
    DocumentationStale,
    DependencyDrift,
    ApiBreakingChange
};

enum class DriftSeverity {
    Info,
    Low,
    Medium,
    High,
    Critical
};

std::string to_string(DriftType type);
std::string to_string(DriftSeverity severity);
std::optional<DriftType> drift_type_from_string(const std::string& text);
std::optional<DriftSeverity> drift_severity_from_string(const std::string& text);
const std::vector<DriftType>& all_drift_types();

struct DriftItem {
    DriftType drift_type = DriftType::MissingImplementation;
    DriftSeverity severity = DriftSeverity::Info;
    std::string description;
    double confidence = 0.0;
    std::string element_id;
    std::string expected;
    std::string actual;
    std::optional<int> line_number;
    bool public_api = false;    // Element is marked breaking-if-removed

    bool operator==(const DriftItem& other) const;
    bool operator!=(const DriftItem& other) const { return !(*this == other); }
};

// Snapshot of one check; never mutated after check() returns
struct DriftReport {
    std::string file_path;
    std::string spec_reference;
    bool spec_loaded = false;
    std::vector<DriftItem> items;
    std::vector<std::string> notices;   // INFO-level, never alerted

    bool empty() const { return items.empty(); }
    DriftSeverity max_severity() const;

    bool operator==(const DriftReport& other) const;
    bool operator!=(const DriftReport& other) const { return !(*this == other); }
};

// Per drift type confidence weights; the single false-positive control
// together with DetectorOptions::min_confidence
struct DriftWeights {
    double missing_implementation = 0.9;
    double signature_mismatch = 0.85;
    double behavior_deviation = 0.7;
    double documentation_stale = 0.6;
    double dependency_drift = 0.8;
    double api_breaking_change = 0.95;

    double weight(DriftType type) const;
};

struct DetectorOptions {
    DriftWeights weights;
    double min_confidence = 0.5;
    std::set<DriftType> enabled_checks;   // Empty enables every check
};

// What was observed for a file when it was last accepted
struct FileBaseline {
    SignatureSet signatures;
    std::map<std::string, std::string> doc_hashes;   // element id -> doc hash
};

struct DriftSummary {
    size_t total_drifts = 0;
    std::map<DriftType, size_t> by_type;
    std::map<DriftSeverity, size_t> by_severity;
    std::vector<std::string> affected_files;
};

class DriftDetector {
public:
    explicit DriftDetector(DetectorOptions options = {});

    // Classify deviation between current signatures and the specification.
    // A null specification yields an empty report carrying an INFO notice.
    DriftReport check(const std::string& file_path,
                      const SignatureSet& current,
                      const Specification* specification) const;

    // Accept the current state of a file as its baseline
    void record_baseline(const std::string& file_path,
                         const SignatureSet& current,
                         const Specification& specification);

    // Record a baseline only for files seen for the first time
    bool ensure_baseline(const std::string& file_path,
                         const SignatureSet& current,
                         const Specification& specification);

    bool has_baseline(const std::string& file_path) const;
    void clear_baseline(const std::string& file_path);

    const DetectorOptions& options() const { return options_; }

    static DriftSummary summarize(const std::vector<DriftReport>& reports);

private:
    bool is_enabled(DriftType type) const;
    void add_item(std::vector<DriftItem>& items, DriftItem item, double certainty) const;
    std::optional<FileBaseline> baseline_for(const std::string& file_path) const;

    DetectorOptions options_;
    std::map<std::string, FileBaseline> baselines_;
    mutable std::shared_mutex baseline_mutex_;
};

// Collapse whitespace so formatting-only differences are not drift
std::string normalize_signature(const std::string& signature);

// Number of parameters in "name(a, b)"; nullopt when there is no parameter list
std::optional<size_t> parameter_count(const std::string& signature);

} // namespace driftwatch
