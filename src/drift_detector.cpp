#include "driftwatch/drift_detector.hpp"
#include "driftwatch/logger.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

namespace driftwatch {

std::string to_string(DriftType type) {
    switch (type) {
        case DriftType::MissingImplementation: return "missing_implementation";
        case DriftType::SignatureMismatch:     return "signature_mismatch";
        case DriftType::BehaviorDeviation:     return "behavior_deviation";
        case DriftType::DocumentationStale:    return "documentation_stale";
        case DriftType::DependencyDrift:       return "dependency_drift";
        case DriftType::ApiBreakingChange:     return "api_breaking_change";
    }
    return "missing_implementation";
}

std::string to_string(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::Info:     return "info";
        case DriftSeverity::Low:      return "low";
        case DriftSeverity::Medium:   return "medium";
        case DriftSeverity::High:     return "high";
        case DriftSeverity::Critical: return "critical";
    }
    return "info";
}

const std::vector<DriftType>& all_drift_types() {
    static const std::vector<DriftType> types = {
        DriftType::MissingImplementation,
        DriftType::SignatureMismatch,
        DriftType::BehaviorDeviation,
        DriftType::DocumentationStale,
        DriftType::DependencyDrift,
        DriftType::ApiBreakingChange
    };
    return types;
}

std::optional<DriftType> drift_type_from_string(const std::string& text) {
    for (DriftType type : all_drift_types()) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<DriftSeverity> drift_severity_from_string(const std::string& text) {
    for (DriftSeverity severity : {DriftSeverity::Info, DriftSeverity::Low, DriftSeverity::Medium,
                                   DriftSeverity::High, DriftSeverity::Critical}) {
        if (to_string(severity) == text) {
            return severity;
        }
    }
    return std::nullopt;
}

bool DriftItem::operator==(const DriftItem& other) const {
    return drift_type == other.drift_type &&
           severity == other.severity &&
           description == other.description &&
           confidence == other.confidence &&
           element_id == other.element_id &&
           expected == other.expected &&
           actual == other.actual &&
           line_number == other.line_number &&
           public_api == other.public_api;
}

DriftSeverity DriftReport::max_severity() const {
    DriftSeverity max = DriftSeverity::Info;
    for (const auto& item : items) {
        max = std::max(max, item.severity);
    }
    return max;
}

bool DriftReport::operator==(const DriftReport& other) const {
    return file_path == other.file_path &&
           spec_reference == other.spec_reference &&
           spec_loaded == other.spec_loaded &&
           items == other.items &&
           notices == other.notices;
}

double DriftWeights::weight(DriftType type) const {
    switch (type) {
        case DriftType::MissingImplementation: return missing_implementation;
        case DriftType::SignatureMismatch:     return signature_mismatch;
        case DriftType::BehaviorDeviation:     return behavior_deviation;
        case DriftType::DocumentationStale:    return documentation_stale;
        case DriftType::DependencyDrift:       return dependency_drift;
        case DriftType::ApiBreakingChange:     return api_breaking_change;
    }
    return 0.0;
}

static bool is_signature_punctuation(char c) {
    return c == '(' || c == ')' || c == ',' || c == ':' || c == '<' || c == '>' ||
           c == '[' || c == ']' || c == '*' || c == '&' || c == '=';
}

std::string normalize_signature(const std::string& signature) {
    std::string out;
    out.reserve(signature.size());
    bool pending_space = false;

    for (char c : signature) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space && !is_signature_punctuation(c) && !is_signature_punctuation(out.back())) {
            out.push_back(' ');
        }
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

std::optional<size_t> parameter_count(const std::string& signature) {
    size_t open = signature.find('(');
    size_t close = signature.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    std::string inner = normalize_signature(signature.substr(open + 1, close - open - 1));
    if (inner.empty()) {
        return 0;
    }

    size_t count = 1;
    int depth = 0;
    for (char c : inner) {
        if (c == '(' || c == '[' || c == '<' || c == '{') ++depth;
        else if (c == ')' || c == ']' || c == '>' || c == '}') --depth;
        else if (c == ',' && depth == 0) ++count;
    }
    return count;
}

DriftDetector::DriftDetector(DetectorOptions options)
    : options_(std::move(options))
{
}

bool DriftDetector::is_enabled(DriftType type) const {
    return options_.enabled_checks.empty() || options_.enabled_checks.count(type) > 0;
}

void DriftDetector::add_item(std::vector<DriftItem>& items, DriftItem item, double certainty) const {
    if (!is_enabled(item.drift_type)) {
        return;
    }

    item.confidence = std::clamp(options_.weights.weight(item.drift_type) * certainty, 0.0, 1.0);
    if (item.confidence < options_.min_confidence) {
        Logger::debug("Dropping low-confidence ", to_string(item.drift_type),
                      " for '", item.element_id, "' (", item.confidence, ")");
        return;
    }
    items.push_back(std::move(item));
}

std::optional<FileBaseline> DriftDetector::baseline_for(const std::string& file_path) const {
    std::shared_lock<std::shared_mutex> lock(baseline_mutex_);
    auto it = baselines_.find(file_path);
    if (it == baselines_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DriftReport DriftDetector::check(const std::string& file_path,
                                 const SignatureSet& current,
                                 const Specification* specification) const {
    DriftReport report;
    report.file_path = file_path;

    if (specification == nullptr) {
        report.notices.push_back("No specification loaded for " + file_path);
        return report;
    }

    report.spec_loaded = true;
    report.spec_reference = specification->source_ref.empty() ? specification->name
                                                              : specification->source_ref;

    // Copy so the whole check sees one baseline state
    const std::optional<FileBaseline> baseline = baseline_for(file_path);

    for (const auto& element : specification->elements) {
        auto current_it = current.find(element.id);
        const ObservedSignature* observed = current_it != current.end() ? &current_it->second : nullptr;

        const ObservedSignature* base = nullptr;
        if (baseline) {
            auto base_it = baseline->signatures.find(element.id);
            if (base_it != baseline->signatures.end()) {
                base = &base_it->second;
            }
        }

        DriftItem item;
        item.element_id = element.id;
        item.expected = element.signature;
        item.public_api = element.is_breaking_if_removed;
        item.actual = observed ? observed->signature : std::string();
        item.line_number = observed ? observed->line_number
                                    : (base ? base->line_number : std::nullopt);

        const std::string expected_signature = normalize_signature(element.signature);

        if (element.kind == ElementKind::Dependency) {
            if (observed == nullptr) {
                item.drift_type = DriftType::DependencyDrift;
                item.severity = DriftSeverity::Medium;
                item.description = "Dependency '" + element.id + "' requires version " +
                                   element.signature + " but is not present";
                add_item(report.items, std::move(item), 1.0);
            } else if (normalize_signature(observed->signature) != expected_signature) {
                item.drift_type = DriftType::DependencyDrift;
                item.severity = DriftSeverity::Medium;
                item.description = "Dependency '" + element.id + "' is at version " +
                                   observed->signature + ", specification declares " + element.signature;
                add_item(report.items, std::move(item), 1.0);
            }
            continue;
        }

        // Previously stable: the baseline held exactly the declared signature
        const bool was_stable = base != nullptr &&
                                normalize_signature(base->signature) == expected_signature;

        if (observed == nullptr) {
            if (element.is_breaking_if_removed && was_stable) {
                item.drift_type = DriftType::ApiBreakingChange;
                item.severity = DriftSeverity::Critical;
                item.description = "Public element '" + element.id + "' was removed";
            } else {
                item.drift_type = DriftType::MissingImplementation;
                item.severity = DriftSeverity::High;
                item.description = "'" + element.id + "' is declared in " + report.spec_reference +
                                   " but not implemented";
            }
            add_item(report.items, std::move(item), 1.0);
            continue;
        }

        if (normalize_signature(observed->signature) != expected_signature) {
            auto expected_arity = parameter_count(element.signature);
            auto actual_arity = parameter_count(observed->signature);
            const bool arity_differs = expected_arity != actual_arity;

            std::ostringstream oss;
            if (element.is_breaking_if_removed && was_stable) {
                item.drift_type = DriftType::ApiBreakingChange;
                item.severity = DriftSeverity::Critical;
                oss << "Public signature of '" << element.id << "' changed incompatibly: expected "
                    << element.signature << ", found " << observed->signature;
            } else {
                item.drift_type = DriftType::SignatureMismatch;
                item.severity = element.is_breaking_if_removed ? DriftSeverity::High : DriftSeverity::Medium;
                oss << "Signature of '" << element.id << "' differs: expected "
                    << element.signature << ", found " << observed->signature;
                if (arity_differs && expected_arity && actual_arity) {
                    oss << " (" << *expected_arity << " parameter(s) expected, "
                        << *actual_arity << " found)";
                }
            }
            item.description = oss.str();
            add_item(report.items, std::move(item), arity_differs ? 1.0 : 0.9);
            continue;
        }

        // Signature matches; compare behavior against what was observed before,
        // falling back to the declared hash
        const bool has_observed_baseline = base != nullptr && !base->behavior_hash.empty();
        const std::string& reference_hash = has_observed_baseline ? base->behavior_hash
                                                                  : element.behavior_hash;
        if (!reference_hash.empty() && !observed->behavior_hash.empty() &&
            observed->behavior_hash != reference_hash) {
            DriftItem behavior = item;
            behavior.drift_type = DriftType::BehaviorDeviation;
            behavior.severity = DriftSeverity::Medium;
            behavior.expected = reference_hash;
            behavior.actual = observed->behavior_hash;
            behavior.description = "Behavior of '" + element.id + "' deviates from " +
                                   (has_observed_baseline ? std::string("the observed baseline")
                                                          : std::string("the specified behavior"));
            add_item(report.items, std::move(behavior), has_observed_baseline ? 1.0 : 0.8);
        }

        // Documentation revised while the code stayed put
        if (baseline && base != nullptr && !element.doc_hash.empty()) {
            auto doc_it = baseline->doc_hashes.find(element.id);
            const bool doc_changed = doc_it != baseline->doc_hashes.end() &&
                                     !doc_it->second.empty() &&
                                     doc_it->second != element.doc_hash;
            const bool code_unchanged = base->signature == observed->signature &&
                                        base->behavior_hash == observed->behavior_hash;
            if (doc_changed && code_unchanged) {
                DriftItem stale = item;
                stale.drift_type = DriftType::DocumentationStale;
                stale.severity = DriftSeverity::Low;
                stale.expected = element.doc_hash;
                stale.actual = doc_it->second;
                stale.description = "Specification for '" + element.id +
                                    "' was revised but the implementation has not changed";
                add_item(report.items, std::move(stale), 1.0);
            }
        }
    }

    return report;
}

static FileBaseline make_baseline(const SignatureSet& current, const Specification& specification) {
    FileBaseline baseline;
    baseline.signatures = current;
    for (const auto& element : specification.elements) {
        baseline.doc_hashes[element.id] = element.doc_hash;
    }
    return baseline;
}

void DriftDetector::record_baseline(const std::string& file_path,
                                    const SignatureSet& current,
                                    const Specification& specification) {
    FileBaseline baseline = make_baseline(current, specification);
    std::unique_lock<std::shared_mutex> lock(baseline_mutex_);
    baselines_[file_path] = std::move(baseline);
}

bool DriftDetector::ensure_baseline(const std::string& file_path,
                                    const SignatureSet& current,
                                    const Specification& specification) {
    std::unique_lock<std::shared_mutex> lock(baseline_mutex_);
    if (baselines_.count(file_path) > 0) {
        return false;
    }
    baselines_.emplace(file_path, make_baseline(current, specification));
    return true;
}

bool DriftDetector::has_baseline(const std::string& file_path) const {
    std::shared_lock<std::shared_mutex> lock(baseline_mutex_);
    return baselines_.count(file_path) > 0;
}

void DriftDetector::clear_baseline(const std::string& file_path) {
    std::unique_lock<std::shared_mutex> lock(baseline_mutex_);
    baselines_.erase(file_path);
}

DriftSummary DriftDetector::summarize(const std::vector<DriftReport>& reports) {
    DriftSummary summary;
    std::set<std::string> files;

    for (const auto& report : reports) {
        if (report.empty()) {
            continue;
        }
        files.insert(report.file_path);
        for (const auto& item : report.items) {
            ++summary.total_drifts;
            ++summary.by_type[item.drift_type];
            ++summary.by_severity[item.severity];
        }
    }

    summary.affected_files.assign(files.begin(), files.end());
    return summary;
}

} // namespace driftwatch
