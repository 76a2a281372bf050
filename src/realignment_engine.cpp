#include "driftwatch/realignment_engine.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include "driftwatch/worker_pool.hpp"
#include <algorithm>
#include <cctype>
#include <tuple>

namespace driftwatch {

std::string to_string(SuggestionCategory category) {
    switch (category) {
        case SuggestionCategory::CodeChange:    return "code_change";
        case SuggestionCategory::SpecUpdate:    return "spec_update";
        case SuggestionCategory::Refactor:      return "refactor";
        case SuggestionCategory::Documentation: return "documentation";
        case SuggestionCategory::TestUpdate:    return "test_update";
        case SuggestionCategory::Dependency:    return "dependency";
    }
    return "code_change";
}

std::string to_string(SuggestionSource source) {
    return source == SuggestionSource::Enricher ? "enricher" : "rule";
}

int priority_for(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::Critical: return 5;
        case DriftSeverity::High:     return 4;
        case DriftSeverity::Medium:   return 3;
        case DriftSeverity::Low:      return 2;
        case DriftSeverity::Info:     return 1;
    }
    return 1;
}

int estimate_effort(const std::string& signature) {
    int effort = 1;
    size_t params = parameter_count(signature).value_or(0);
    if (params >= 2) ++effort;
    if (params >= 4) ++effort;
    if (signature.size() > 60) ++effort;
    if (signature.size() > 120) ++effort;
    return std::min(effort, 5);
}

namespace {

int lower_priority(int priority) {
    return std::max(1, priority - 1);
}

// Leading digit run of a version string such as "^2.1" or "v3", leading zeros stripped
std::optional<std::string> major_version(const std::string& version) {
    size_t start = version.find_first_of("0123456789");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    size_t end = start;
    while (end < version.size() && std::isdigit(static_cast<unsigned char>(version[end]))) {
        ++end;
    }
    while (start + 1 < end && version[start] == '0') {
        ++start;
    }
    return version.substr(start, end - start);
}

Suggestion make(const DriftItem& item, const std::string& file_path, SuggestionCategory category,
                std::string title, std::string description, int priority, int effort) {
    Suggestion s;
    s.category = category;
    s.title = std::move(title);
    s.description = std::move(description);
    s.priority = priority;
    s.effort = effort;
    s.confidence = item.confidence;
    s.file_path = file_path;
    s.line_number = item.line_number;
    s.code_snippet = item.actual;
    s.spec_snippet = item.expected;
    return s;
}

} // namespace

RealignmentEngine::RealignmentEngine(RealignmentOptions options)
    : options_(options)
{
}

std::vector<Suggestion> RealignmentEngine::suggestions_for(const DriftItem& item,
                                                           const std::string& file_path) const {
    std::vector<Suggestion> out;
    const std::string& id = item.element_id;
    int priority = priority_for(item.severity);
    int effort = estimate_effort(item.expected);

    switch (item.drift_type) {
        case DriftType::MissingImplementation:
            out.push_back(make(item, file_path, SuggestionCategory::CodeChange,
                "Implement " + id,
                "Add an implementation matching the specified signature: " + item.expected,
                priority, effort));
            out.push_back(make(item, file_path, SuggestionCategory::TestUpdate,
                "Add tests for " + id,
                "Cover the new implementation of " + id + " with tests.",
                lower_priority(priority), std::max(1, effort - 1)));
            if (!item.public_api) {
                out.push_back(make(item, file_path, SuggestionCategory::SpecUpdate,
                    "Remove " + id + " from the specification",
                    "If " + id + " is no longer planned, update the specification instead.",
                    lower_priority(priority), 1));
            }
            break;

        case DriftType::SignatureMismatch: {
            out.push_back(make(item, file_path, SuggestionCategory::CodeChange,
                "Update signature of " + id,
                "Change the signature from '" + item.actual + "' to '" + item.expected + "'.",
                priority, effort));
            auto expected_params = parameter_count(item.expected);
            auto actual_params = parameter_count(item.actual);
            if (expected_params && actual_params && *actual_params < *expected_params) {
                out.push_back(make(item, file_path, SuggestionCategory::Documentation,
                    "Document parameter removal in " + id,
                    "Callers written against '" + item.expected + "' need a migration note.",
                    lower_priority(priority), 1));
                out.push_back(make(item, file_path, SuggestionCategory::Refactor,
                    "Add a compatibility wrapper for " + id,
                    "Keep the specified signature available and forward to the new one.",
                    lower_priority(priority), std::min(5, effort + 1)));
            }
            break;
        }

        case DriftType::BehaviorDeviation:
            out.push_back(make(item, file_path, SuggestionCategory::CodeChange,
                "Restore specified behavior of " + id,
                "The behavior of " + id + " no longer matches; review recent changes to its body.",
                priority, effort));
            out.push_back(make(item, file_path, SuggestionCategory::TestUpdate,
                "Add a regression test for " + id,
                "Pin the specified behavior of " + id + " with a test.",
                lower_priority(priority), std::max(1, effort - 1)));
            break;

        case DriftType::DocumentationStale:
            out.push_back(make(item, file_path, SuggestionCategory::Documentation,
                "Synchronize documentation of " + id,
                "The documentation of " + id + " changed while its code did not; bring them back in line.",
                priority, 1));
            break;

        case DriftType::DependencyDrift: {
            out.push_back(make(item, file_path, SuggestionCategory::Dependency,
                "Pin " + id + " to " + item.expected,
                "Installed version '" + item.actual + "' differs from the required '" + item.expected + "'.",
                priority, 1));
            auto expected_major = major_version(item.expected);
            auto actual_major = major_version(item.actual);
            if (expected_major && actual_major && *expected_major != *actual_major) {
                out.push_back(make(item, file_path, SuggestionCategory::TestUpdate,
                    "Run compatibility tests against " + id + " " + item.actual,
                    "A major version change may break callers of " + id + ".",
                    lower_priority(priority), 2));
            }
            break;
        }

        case DriftType::ApiBreakingChange:
            out.push_back(make(item, file_path, SuggestionCategory::CodeChange,
                "Restore or deprecate " + id,
                "Public API " + id + " changed; restore '" + item.expected +
                "' or keep it as a deprecated alias.",
                priority, effort));
            out.push_back(make(item, file_path, SuggestionCategory::Documentation,
                "Bump the major version for " + id,
                "Record the breaking change to " + id + " in the changelog and bump the major version.",
                lower_priority(priority), 1));
            break;
    }
    return out;
}

std::vector<Suggestion> RealignmentEngine::rule_suggestions(const DriftReport& report) const {
    std::vector<Suggestion> suggestions;
    for (const auto& item : report.items) {
        for (auto& suggestion : suggestions_for(item, report.file_path)) {
            suggestions.push_back(std::move(suggestion));
        }
    }
    return suggestions;
}

std::vector<Suggestion> RealignmentEngine::run_enricher(const DriftReport& report,
                                                        const std::shared_ptr<SuggestionEnricher>& enricher) const {
    auto future = run_detached([enricher, report]() { return enricher->enrich(report); });
    if (future.wait_for(options_.enricher_timeout) != std::future_status::ready) {
        Logger::warning("Suggestion enricher timed out after ", options_.enricher_timeout.count(),
                        " ms, using rule suggestions");
        return {};
    }

    try {
        return future.get();
    } catch (const SuggestionGenerationError& e) {
        Logger::warning("Suggestion enricher failed: ", e.what());
    } catch (const std::exception& e) {
        Logger::warning("Suggestion enricher raised: ", e.what());
    } catch (...) {
        Logger::warning("Suggestion enricher raised an unknown error, using rule suggestions");
    }
    return {};
}

void RealignmentEngine::merge(std::vector<Suggestion>& suggestions, std::vector<Suggestion> enriched) const {
    auto key = [](const Suggestion& s) { return std::tie(s.category, s.file_path, s.title); };

    for (auto& candidate : enriched) {
        candidate.priority = std::clamp(candidate.priority, 1, 5);
        candidate.effort = std::clamp(candidate.effort, 1, 5);
        candidate.confidence = std::clamp(candidate.confidence, 0.0, 1.0);
        candidate.source = SuggestionSource::Enricher;
        candidate.enricher_confidence.reset();

        auto existing = std::find_if(suggestions.begin(), suggestions.end(),
                                     [&](const Suggestion& s) { return key(s) == key(candidate); });
        if (existing != suggestions.end()) {
            existing->enricher_confidence = candidate.confidence;
            continue;
        }
        suggestions.push_back(std::move(candidate));
    }
}

void RealignmentEngine::rank(std::vector<Suggestion>& suggestions) const {
    std::stable_sort(suggestions.begin(), suggestions.end(), [](const Suggestion& a, const Suggestion& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.effort < b.effort;
    });
    if (options_.max_suggestions > 0 && suggestions.size() > options_.max_suggestions) {
        suggestions.resize(options_.max_suggestions);
    }
}

std::vector<Suggestion> RealignmentEngine::suggest(const DriftReport& report,
                                                   std::shared_ptr<SuggestionEnricher> enricher) const {
    std::vector<Suggestion> suggestions = rule_suggestions(report);

    if (enricher) {
        merge(suggestions, run_enricher(report, enricher));
    }

    rank(suggestions);
    Logger::debug("Generated ", suggestions.size(), " suggestions for ", report.file_path);
    return suggestions;
}

std::vector<Suggestion> RealignmentEngine::suggest_for_alert(const Alert& alert,
                                                             std::shared_ptr<SuggestionEnricher> enricher) const {
    DriftReport report;
    report.file_path = alert.file_path;
    report.spec_loaded = true;
    auto spec_it = alert.context.find("spec_reference");
    if (spec_it != alert.context.end()) {
        report.spec_reference = spec_it->second;
    }
    auto items_it = alert.context.find("items");
    if (items_it != alert.context.end()) {
        report.items = drift_items_from_json(items_it->second);
    }

    if (!report.items.empty()) {
        return suggest(report, std::move(enricher));
    }

    Suggestion investigate;
    investigate.category = SuggestionCategory::CodeChange;
    investigate.title = "Investigate alert #" + std::to_string(alert.id);
    investigate.description = alert.title + (alert.message.empty() ? "" : "\n" + alert.message);
    switch (alert.severity) {
        case AlertSeverity::Critical: investigate.priority = 5; break;
        case AlertSeverity::Error:    investigate.priority = 4; break;
        case AlertSeverity::Warning:  investigate.priority = 3; break;
        case AlertSeverity::Info:     investigate.priority = 2; break;
    }
    investigate.effort = 2;
    investigate.confidence = 0.5;
    investigate.file_path = alert.file_path;
    return {investigate};
}

} // namespace driftwatch
