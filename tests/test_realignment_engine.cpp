#include <catch2/catch_test_macros.hpp>
#include "driftwatch/errors.hpp"
#include "driftwatch/realignment_engine.hpp"
#include <thread>

using namespace driftwatch;
using namespace std::chrono_literals;

namespace {

DriftItem item(DriftType type, DriftSeverity severity, const std::string& id,
               const std::string& expected, const std::string& actual) {
    DriftItem i;
    i.drift_type = type;
    i.severity = severity;
    i.element_id = id;
    i.expected = expected;
    i.actual = actual;
    i.confidence = 0.85;
    i.description = id + " drifted";
    return i;
}

DriftReport calc_report() {
    DriftReport report;
    report.file_path = "src/calc.py";
    report.spec_reference = "specs/calculator.md";
    report.spec_loaded = true;
    report.items.push_back(item(DriftType::SignatureMismatch, DriftSeverity::High, "calc", "calc(a, b)", "calc(a)"));
    report.items.push_back(item(DriftType::DocumentationStale, DriftSeverity::Low, "parse", "doc-v2", "doc-v1"));
    return report;
}

bool is_ranked(const std::vector<Suggestion>& suggestions) {
    for (size_t i = 1; i < suggestions.size(); ++i) {
        const auto& a = suggestions[i - 1];
        const auto& b = suggestions[i];
        if (a.priority < b.priority) return false;
        if (a.priority == b.priority && a.effort > b.effort) return false;
    }
    return true;
}

class ThrowingEnricher : public SuggestionEnricher {
public:
    std::vector<Suggestion> enrich(const DriftReport&) override {
        throw SuggestionGenerationError("model unavailable");
    }
};

class IntThrowingEnricher : public SuggestionEnricher {
public:
    std::vector<Suggestion> enrich(const DriftReport&) override {
        throw 42;
    }
};

class SlowEnricher : public SuggestionEnricher {
public:
    std::vector<Suggestion> enrich(const DriftReport& report) override {
        std::this_thread::sleep_for(300ms);
        Suggestion late;
        late.title = "Late idea";
        late.file_path = report.file_path;
        return {late};
    }
};

class FixedEnricher : public SuggestionEnricher {
public:
    std::vector<Suggestion> enrich(const DriftReport& report) override {
        Suggestion duplicate;
        duplicate.category = SuggestionCategory::CodeChange;
        duplicate.title = "Update signature of calc";
        duplicate.file_path = report.file_path;
        duplicate.confidence = 0.95;

        Suggestion extra;
        extra.category = SuggestionCategory::Refactor;
        extra.title = "Split calc into add and multiply";
        extra.file_path = report.file_path;
        extra.priority = 9;
        extra.effort = 0;
        extra.confidence = 1.7;
        return {duplicate, extra};
    }
};

} // namespace

TEST_CASE("Rule suggestions cover each drift item", "[realign]") {
    RealignmentEngine engine;
    auto suggestions = engine.suggest(calc_report());

    REQUIRE(suggestions.size() == 4);
    REQUIRE(is_ranked(suggestions));
    REQUIRE(suggestions[0].title == "Update signature of calc");
    REQUIRE(suggestions[0].priority == 4);
    REQUIRE(suggestions[0].category == SuggestionCategory::CodeChange);
    REQUIRE(suggestions[0].spec_snippet == "calc(a, b)");
    REQUIRE(suggestions[0].code_snippet == "calc(a)");
    REQUIRE(suggestions[0].source == SuggestionSource::Rule);
    REQUIRE(suggestions.back().title == "Synchronize documentation of parse");

    SECTION("Missing non-public element suggests a specification update") {
        DriftReport report;
        report.file_path = "a.py";
        report.items.push_back(item(DriftType::MissingImplementation, DriftSeverity::High, "helper", "helper(x)", ""));
        auto missing = engine.suggest(report);
        REQUIRE(missing.size() == 3);
        REQUIRE(missing[0].title == "Implement helper");

        report.items[0].public_api = true;
        REQUIRE(engine.suggest(report).size() == 2);
    }

    SECTION("Major dependency upgrade adds a compatibility test") {
        DriftReport report;
        report.file_path = "requirements.txt";
        report.items.push_back(item(DriftType::DependencyDrift, DriftSeverity::Medium, "requests", "2.31.0", "3.0.1"));
        auto deps = engine.suggest(report);
        REQUIRE(deps.size() == 2);
        REQUIRE(deps[0].category == SuggestionCategory::Dependency);
        REQUIRE(deps[1].category == SuggestionCategory::TestUpdate);
    }

    SECTION("Version numbers longer than a machine word still compare") {
        DriftReport report;
        report.file_path = "requirements.txt";
        report.items.push_back(item(DriftType::DependencyDrift, DriftSeverity::Medium, "tzdata",
                                    "2024.1", "202401011200000000000"));
        std::vector<Suggestion> deps;
        REQUIRE_NOTHROW(deps = engine.suggest(report));
        REQUIRE(deps.size() == 2);
        REQUIRE(deps[1].category == SuggestionCategory::TestUpdate);
    }

    SECTION("Leading zeros do not make a major change") {
        DriftReport report;
        report.file_path = "requirements.txt";
        report.items.push_back(item(DriftType::DependencyDrift, DriftSeverity::Medium, "lib", "02.1", "2.5"));
        REQUIRE(engine.suggest(report).size() == 1);
    }

    SECTION("Empty report yields nothing") {
        REQUIRE(engine.suggest(DriftReport{}).empty());
    }
}

TEST_CASE("Enricher failures fall back to rule suggestions", "[realign]") {
    RealignmentOptions options;
    options.enricher_timeout = 50ms;
    RealignmentEngine engine(options);
    auto baseline = engine.suggest(calc_report());

    SECTION("Throwing enricher") {
        auto suggestions = engine.suggest(calc_report(), std::make_shared<ThrowingEnricher>());
        REQUIRE(suggestions.size() == baseline.size());
        REQUIRE_FALSE(suggestions.empty());
    }

    SECTION("Enricher throwing a non-standard exception") {
        auto suggestions = engine.suggest(calc_report(), std::make_shared<IntThrowingEnricher>());
        REQUIRE(suggestions.size() == baseline.size());
        for (const auto& s : suggestions) {
            REQUIRE(s.source == SuggestionSource::Rule);
        }
    }

    SECTION("Enricher exceeding its timeout") {
        auto suggestions = engine.suggest(calc_report(), std::make_shared<SlowEnricher>());
        REQUIRE(suggestions.size() == baseline.size());
        for (const auto& s : suggestions) {
            REQUIRE(s.source == SuggestionSource::Rule);
        }
    }
}

TEST_CASE("Enricher output is merged and clamped", "[realign]") {
    RealignmentEngine engine;
    auto suggestions = engine.suggest(calc_report(), std::make_shared<FixedEnricher>());

    REQUIRE(suggestions.size() == 5);
    REQUIRE(is_ranked(suggestions));

    const Suggestion& top = suggestions[0];
    REQUIRE(top.title == "Split calc into add and multiply");
    REQUIRE(top.source == SuggestionSource::Enricher);
    REQUIRE(top.priority == 5);
    REQUIRE(top.effort == 1);
    REQUIRE(top.confidence == 1.0);

    const Suggestion& rule = suggestions[1];
    REQUIRE(rule.title == "Update signature of calc");
    REQUIRE(rule.source == SuggestionSource::Rule);
    REQUIRE(rule.enricher_confidence.has_value());
    REQUIRE(*rule.enricher_confidence == 0.95);
}

TEST_CASE("Suggestion count is capped", "[realign]") {
    RealignmentOptions options;
    options.max_suggestions = 2;
    RealignmentEngine engine(options);
    auto suggestions = engine.suggest(calc_report());
    REQUIRE(suggestions.size() == 2);
    REQUIRE(suggestions[0].priority == 4);
}

TEST_CASE("Suggestions for a stored alert", "[realign]") {
    RealignmentEngine engine;
    Alert alert;
    alert.id = 7;
    alert.severity = AlertSeverity::Error;
    alert.title = "signature_mismatch in src/calc.py";
    alert.file_path = "src/calc.py";

    SECTION("Items in the context are rebuilt into a report") {
        alert.context["items"] = drift_items_to_json(calc_report().items);
        alert.context["spec_reference"] = "specs/calculator.md";
        auto suggestions = engine.suggest_for_alert(alert);
        REQUIRE(suggestions.size() == 4);
        REQUIRE(suggestions[0].file_path == "src/calc.py");
    }

    SECTION("Alerts without items get a single investigation task") {
        auto suggestions = engine.suggest_for_alert(alert);
        REQUIRE(suggestions.size() == 1);
        REQUIRE(suggestions[0].title == "Investigate alert #7");
        REQUIRE(suggestions[0].priority == 4);
    }
}

TEST_CASE("Priority and effort helpers", "[realign]") {
    REQUIRE(priority_for(DriftSeverity::Critical) == 5);
    REQUIRE(priority_for(DriftSeverity::Info) == 1);
    REQUIRE(estimate_effort("f()") == 1);
    REQUIRE(estimate_effort("calc(a, b)") == 2);
    REQUIRE(estimate_effort("configure(a, b, c, d)") == 3);

    std::string long_signature = "configure(const std::string& name, const std::vector<int>& values, "
                                 "std::map<std::string, int> options, bool strict, int retries)";
    REQUIRE(estimate_effort(long_signature) == 5);
}
