#include <catch2/catch_test_macros.hpp>
#include "driftwatch/drift_detector.hpp"

using namespace driftwatch;

namespace {

ExpectedElement function(const std::string& id, const std::string& signature, bool breaking = false) {
    ExpectedElement element;
    element.id = id;
    element.kind = ElementKind::Function;
    element.signature = signature;
    element.is_breaking_if_removed = breaking;
    return element;
}

Specification calc_spec() {
    Specification spec;
    spec.name = "calculator";
    spec.source_ref = "specs/calculator.md";
    spec.elements.push_back(function("calc", "calc(a, b)", true));
    return spec;
}

ObservedSignature observed(const std::string& signature, const std::string& behavior = "", int line = 1) {
    return ObservedSignature{signature, behavior, line};
}

} // namespace

TEST_CASE("Signature with fewer parameters is a high severity mismatch", "[drift]") {
    DriftDetector detector;
    Specification spec = calc_spec();
    SignatureSet current{{"calc", observed("calc(a)")}};

    DriftReport report = detector.check("src/calc.py", current, &spec);

    REQUIRE(report.spec_loaded);
    REQUIRE(report.spec_reference == "specs/calculator.md");
    REQUIRE(report.items.size() == 1);
    REQUIRE(report.items[0].drift_type == DriftType::SignatureMismatch);
    REQUIRE(report.items[0].severity == DriftSeverity::High);
    REQUIRE(report.items[0].element_id == "calc");
    REQUIRE(report.items[0].expected == "calc(a, b)");
    REQUIRE(report.items[0].actual == "calc(a)");
    REQUIRE(report.items[0].line_number == 1);
}

TEST_CASE("Drift classification", "[drift]") {
    DriftDetector detector;
    Specification spec;
    spec.name = "api";
    spec.elements.push_back(function("open", "open(path)", true));
    spec.elements.push_back(function("helper", "helper(x)"));

    SECTION("Matching signatures produce an empty report") {
        SignatureSet current{{"open", observed("open( path )")}, {"helper", observed("helper(x)")}};
        DriftReport report = detector.check("a.py", current, &spec);
        REQUIRE(report.empty());
        REQUIRE(report.spec_reference == "api");
    }

    SECTION("Missing identifier is a missing implementation") {
        SignatureSet current{{"open", observed("open(path)")}};
        DriftReport report = detector.check("a.py", current, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::MissingImplementation);
        REQUIRE(report.items[0].severity == DriftSeverity::High);
        REQUIRE(report.items[0].element_id == "helper");
    }

    SECTION("Non-public signature change is medium") {
        SignatureSet current{{"open", observed("open(path)")}, {"helper", observed("helper(x, y)")}};
        DriftReport report = detector.check("a.py", current, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::SignatureMismatch);
        REQUIRE(report.items[0].severity == DriftSeverity::Medium);
    }

    SECTION("Items follow specification order") {
        SignatureSet current;
        DriftReport report = detector.check("a.py", current, &spec);
        REQUIRE(report.items.size() == 2);
        REQUIRE(report.items[0].element_id == "open");
        REQUIRE(report.items[1].element_id == "helper");
    }
}

TEST_CASE("Public API changes against a stable baseline are breaking", "[drift]") {
    DriftDetector detector;
    Specification spec = calc_spec();
    SignatureSet stable{{"calc", observed("calc(a, b)", "h1")}};

    REQUIRE(detector.ensure_baseline("src/calc.py", stable, spec));
    REQUIRE_FALSE(detector.ensure_baseline("src/calc.py", stable, spec));
    REQUIRE(detector.has_baseline("src/calc.py"));

    SECTION("Removal") {
        DriftReport report = detector.check("src/calc.py", {}, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::ApiBreakingChange);
        REQUIRE(report.items[0].severity == DriftSeverity::Critical);
    }

    SECTION("Signature change") {
        SignatureSet current{{"calc", observed("calc(a)", "h1")}};
        DriftReport report = detector.check("src/calc.py", current, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::ApiBreakingChange);
    }

    SECTION("Clearing the baseline downgrades to a mismatch") {
        detector.clear_baseline("src/calc.py");
        SignatureSet current{{"calc", observed("calc(a)", "h1")}};
        DriftReport report = detector.check("src/calc.py", current, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::SignatureMismatch);
    }
}

TEST_CASE("Behavior deviation", "[drift]") {
    DriftDetector detector;
    Specification spec;
    spec.name = "calc";
    ExpectedElement element = function("add", "add(a, b)");
    element.behavior_hash = "declared";
    spec.elements.push_back(element);

    SECTION("Against the declared hash without a baseline") {
        SignatureSet current{{"add", observed("add(a, b)", "other")}};
        DriftReport report = detector.check("m.py", current, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::BehaviorDeviation);
        REQUIRE(report.items[0].severity == DriftSeverity::Medium);
        // 0.7 weight scaled by 0.8 for a declared reference
        REQUIRE(report.items[0].confidence > 0.55);
        REQUIRE(report.items[0].confidence < 0.57);
    }

    SECTION("Against the observed baseline") {
        detector.record_baseline("m.py", {{"add", observed("add(a, b)", "observed")}}, spec);

        SignatureSet same{{"add", observed("add(a, b)", "observed")}};
        REQUIRE(detector.check("m.py", same, &spec).empty());

        SignatureSet changed{{"add", observed("add(a, b)", "changed")}};
        DriftReport report = detector.check("m.py", changed, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::BehaviorDeviation);
        REQUIRE(report.items[0].expected == "observed");
        REQUIRE(report.items[0].actual == "changed");
    }
}

TEST_CASE("Documentation revised without a code change is stale", "[drift]") {
    DriftDetector detector;
    Specification spec;
    spec.name = "docs";
    ExpectedElement element = function("parse", "parse(text)");
    element.doc_hash = "doc-v1";
    spec.elements.push_back(element);

    SignatureSet current{{"parse", observed("parse(text)", "b1")}};
    detector.record_baseline("p.py", current, spec);
    REQUIRE(detector.check("p.py", current, &spec).empty());

    spec.elements[0].doc_hash = "doc-v2";
    DriftReport report = detector.check("p.py", current, &spec);
    REQUIRE(report.items.size() == 1);
    REQUIRE(report.items[0].drift_type == DriftType::DocumentationStale);
    REQUIRE(report.items[0].severity == DriftSeverity::Low);
}

TEST_CASE("Dependency version drift", "[drift]") {
    DriftDetector detector;
    Specification spec;
    spec.name = "deps";
    ExpectedElement dependency;
    dependency.id = "requests";
    dependency.kind = ElementKind::Dependency;
    dependency.signature = "2.31.0";
    spec.elements.push_back(dependency);

    SECTION("Matching version") {
        REQUIRE(detector.check("requirements.txt", {{"requests", observed("2.31.0")}}, &spec).empty());
    }

    SECTION("Different version") {
        DriftReport report = detector.check("requirements.txt", {{"requests", observed("3.0.0")}}, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::DependencyDrift);
        REQUIRE(report.items[0].severity == DriftSeverity::Medium);
    }

    SECTION("Absent dependency") {
        DriftReport report = detector.check("requirements.txt", {}, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].drift_type == DriftType::DependencyDrift);
    }
}

TEST_CASE("Confidence threshold and disabled checks filter items", "[drift]") {
    Specification spec = calc_spec();
    SignatureSet current{{"calc", observed("calc(a)")}};

    SECTION("Items below min_confidence are dropped") {
        DetectorOptions options;
        options.min_confidence = 0.9;
        DriftDetector detector(options);
        REQUIRE(detector.check("c.py", current, &spec).empty());
    }

    SECTION("Weight table changes confidence") {
        DetectorOptions options;
        options.weights.signature_mismatch = 0.5;
        DriftDetector detector(options);
        DriftReport report = detector.check("c.py", current, &spec);
        REQUIRE(report.items.size() == 1);
        REQUIRE(report.items[0].confidence == 0.5);
    }

    SECTION("Disabled check kinds are skipped") {
        DetectorOptions options;
        options.enabled_checks = {DriftType::MissingImplementation};
        DriftDetector detector(options);
        REQUIRE(detector.check("c.py", current, &spec).empty());
    }
}

TEST_CASE("Repeated checks on identical inputs are equal", "[drift]") {
    DriftDetector detector;
    Specification spec = calc_spec();
    SignatureSet current{{"calc", observed("calc(a)")}};

    DriftReport first = detector.check("src/calc.py", current, &spec);
    DriftReport second = detector.check("src/calc.py", current, &spec);
    REQUIRE(first == second);
}

TEST_CASE("Missing specification yields a notice and no items", "[drift]") {
    DriftDetector detector;
    DriftReport report = detector.check("orphan.py", {{"x", observed("x()")}}, nullptr);
    REQUIRE(report.empty());
    REQUIRE_FALSE(report.spec_loaded);
    REQUIRE(report.notices.size() == 1);
}

TEST_CASE("Signature helpers", "[drift]") {
    REQUIRE(normalize_signature("calc( a ,  b )") == "calc(a,b)");
    REQUIRE(normalize_signature("unsigned  int f()") == "unsigned int f()");
    REQUIRE(parameter_count("calc(a, b)") == 2u);
    REQUIRE(parameter_count("calc()") == 0u);
    REQUIRE(parameter_count("f(std::map<int, int> m, int n)") == 2u);
    REQUIRE_FALSE(parameter_count("Widget").has_value());
}

TEST_CASE("Summaries count by type and file", "[drift]") {
    DriftDetector detector;
    Specification spec = calc_spec();
    std::vector<DriftReport> reports = {
        detector.check("a.py", {{"calc", observed("calc(a)")}}, &spec),
        detector.check("b.py", {}, &spec),
        detector.check("c.py", {{"calc", observed("calc(a, b)")}}, &spec),
    };

    DriftSummary summary = DriftDetector::summarize(reports);
    REQUIRE(summary.total_drifts == 2);
    REQUIRE(summary.by_type[DriftType::SignatureMismatch] == 1);
    REQUIRE(summary.by_type[DriftType::MissingImplementation] == 1);
    REQUIRE(summary.affected_files.size() == 2);
}
