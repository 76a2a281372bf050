#pragma once

#include "driftwatch/alert.hpp"
#include "driftwatch/drift_detector.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace driftwatch {

enum class SuggestionCategory {
    CodeChange,
    SpecUpdate,
    Refactor,
    Documentation,
    TestUpdate,
    Dependency
};

enum class SuggestionSource {
    Rule,
    Enricher
};

std::string to_string(SuggestionCategory category);
std::string to_string(SuggestionSource source);

struct Suggestion {
    SuggestionCategory category = SuggestionCategory::CodeChange;
    std::string title;
    std::string description;
    int priority = 1;           // 1 (lowest) to 5
    int effort = 1;             // 1 (trivial) to 5
    double confidence = 0.0;
    std::string file_path;
    std::optional<int> line_number;
    std::string code_snippet;
    std::string spec_snippet;
    SuggestionSource source = SuggestionSource::Rule;
    std::optional<double> enricher_confidence;
};

// Optional external capability, e.g. an AI model. May be slow or fail.
class SuggestionEnricher {
public:
    virtual ~SuggestionEnricher() = default;
    virtual std::vector<Suggestion> enrich(const DriftReport& report) = 0;
};

struct RealignmentOptions {
    std::chrono::milliseconds enricher_timeout{10000};
    size_t max_suggestions = 20;
};

class RealignmentEngine {
public:
    explicit RealignmentEngine(RealignmentOptions options = {});

    // Ranked by priority descending, then effort ascending. Never empty for
    // a non-empty report, whatever the enricher does.
    std::vector<Suggestion> suggest(const DriftReport& report,
                                    std::shared_ptr<SuggestionEnricher> enricher = nullptr) const;

    // Rebuilds the report from the alert context
    std::vector<Suggestion> suggest_for_alert(const Alert& alert,
                                              std::shared_ptr<SuggestionEnricher> enricher = nullptr) const;

    // Rule templates only
    std::vector<Suggestion> rule_suggestions(const DriftReport& report) const;

    const RealignmentOptions& options() const { return options_; }

private:
    std::vector<Suggestion> suggestions_for(const DriftItem& item, const std::string& file_path) const;
    std::vector<Suggestion> run_enricher(const DriftReport& report,
                                         const std::shared_ptr<SuggestionEnricher>& enricher) const;
    void merge(std::vector<Suggestion>& suggestions, std::vector<Suggestion> enriched) const;
    void rank(std::vector<Suggestion>& suggestions) const;

    RealignmentOptions options_;
};

int priority_for(DriftSeverity severity);

// 1 to 5 from the parameter count and length of a signature
int estimate_effort(const std::string& signature);

} // namespace driftwatch
