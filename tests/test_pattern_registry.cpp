#include <catch2/catch_test_macros.hpp>
#include "redact/pattern_registry.hpp"
#include "core/error.hpp"

#include <regex>
#include <string>
#include <vector>

using namespace logscrub;

static std::vector<std::string> detector_names(const PatternRegistry& registry) {
    std::vector<std::string> names;
    for (const auto& d : registry.detectors()) {
        names.push_back(d.name);
    }
    return names;
}

// ============================================================================
// Built-in registry
// ============================================================================

TEST_CASE("Default registry detector order", "[registry]") {
    const auto registry = PatternRegistry::defaults();

    const std::vector<std::string> expected = {
        "github_token",
        "github_fine_grained_pat",
        "jwt",
        "authorization_header",
        "auth_scheme",
        "quoted_sensitive_assignment",
        "sensitive_assignment",
        "hex_secret",
        "base64_secret",
    };
    CHECK(detector_names(*registry) == expected);

    // Kinds never go back to a higher priority
    const auto& detectors = registry->detectors();
    for (size_t i = 1; i < detectors.size(); ++i) {
        CHECK(static_cast<int>(detectors[i - 1].kind) <= static_cast<int>(detectors[i].kind));
    }
}

TEST_CASE("Default registry is built once", "[registry]") {
    CHECK(PatternRegistry::defaults() == PatternRegistry::defaults());
    CHECK(PatternRegistry::defaults()->mask() == std::string(kRedactionMask));
}

TEST_CASE("Default registry detectors never match the mask", "[registry]") {
    const auto registry = PatternRegistry::defaults();
    for (const auto& detector : registry->detectors()) {
        INFO(detector.name);
        CHECK_FALSE(std::regex_search(registry->mask(), detector.pattern));
    }
}

TEST_CASE("Registry find by name", "[registry]") {
    const auto registry = PatternRegistry::defaults();

    const auto* header = registry->find("authorization_header");
    REQUIRE(header != nullptr);
    CHECK(header->kind == DetectorKind::HEADER);
    CHECK(header->secret_group == 2);

    const auto* base64 = registry->find("base64_secret");
    REQUIRE(base64 != nullptr);
    CHECK(base64->min_entropy > 4.0);

    CHECK(registry->find("no_such_detector") == nullptr);
}

// ============================================================================
// Builder
// ============================================================================

TEST_CASE("Builder orders custom detectors by kind", "[registry]") {
    const auto registry = PatternRegistry::Builder()
        .add_detector("generic_one", DetectorKind::GENERIC_SECRET, "zz[0-9]{4}")
        .add_detector("token_one", DetectorKind::TOKEN, "tk_[a-z]{8}")
        .add_detector("header_one", DetectorKind::HEADER, "(X-Key: )([a-z]+)", 2)
        .add_detector("token_two", DetectorKind::TOKEN, "tt_[a-z]{8}")
        .build();

    const std::vector<std::string> expected = {
        "token_one", "token_two", "header_one", "generic_one"};
    CHECK(detector_names(*registry) == expected);
}

TEST_CASE("Builder rejects malformed patterns", "[registry]") {
    PatternRegistry::Builder builder;
    builder.add_detector("broken", DetectorKind::TOKEN, "([a-z");

    try {
        (void)builder.build();
        FAIL("build() should have thrown");
    } catch (const PatternCompilationError& e) {
        CHECK(e.detector() == "broken");
        CHECK(e.category() == ErrorCategory::PATTERN_COMPILATION);
    }
}

TEST_CASE("Builder rejects invalid registries", "[registry]") {
    SECTION("Secret group beyond capture count") {
        PatternRegistry::Builder builder;
        builder.add_detector("no_groups", DetectorKind::TOKEN, "abc[0-9]+", 1);
        CHECK_THROWS_AS(builder.build(), PatternCompilationError);
    }

    SECTION("Duplicate detector names") {
        PatternRegistry::Builder builder;
        builder.add_detector("twice", DetectorKind::TOKEN, "aa[0-9]+")
               .add_detector("twice", DetectorKind::GENERIC_SECRET, "bb[0-9]+");
        CHECK_THROWS_AS(builder.build(), PatternCompilationError);
    }

    SECTION("Empty detector name") {
        PatternRegistry::Builder builder;
        builder.add_detector("", DetectorKind::TOKEN, "aa[0-9]+");
        CHECK_THROWS_AS(builder.build(), PatternCompilationError);
    }

    SECTION("Empty mask") {
        PatternRegistry::Builder builder;
        builder.add_builtin_detectors().set_mask("");
        CHECK_THROWS_AS(builder.build(), PatternCompilationError);
    }

    SECTION("Detector that matches the mask") {
        PatternRegistry::Builder builder;
        builder.add_detector("stars", DetectorKind::TOKEN, R"(\*{3}[A-Z]+)");
        try {
            (void)builder.build();
            FAIL("build() should have thrown");
        } catch (const PatternCompilationError& e) {
            CHECK(e.detector() == "stars");
        }
    }

    SECTION("Mask shaped like a secret") {
        PatternRegistry::Builder builder;
        builder.add_builtin_detectors()
               .set_mask("0123456789abcdef0123456789abcdef");
        CHECK_THROWS_AS(builder.build(), PatternCompilationError);
    }
}

TEST_CASE("Mask check applies the detector's post-match filters", "[registry]") {
    // Base64-alphabet run, but no digit: base64_secret would never redact it
    const std::string mask = "REDACTEDredactedREDACTEDredactedREDACTEDx";
    const auto registry = PatternRegistry::Builder()
        .add_builtin_detectors()
        .set_mask(mask)
        .build();
    CHECK(registry->mask() == mask);
    CHECK(registry->find("base64_secret") != nullptr);
}

TEST_CASE("Builder remove_detector", "[registry]") {
    const auto registry = PatternRegistry::Builder()
        .add_builtin_detectors()
        .add_builtin_sensitive_keys()
        .remove_detector("base64_secret")
        .remove_detector("not_registered")
        .build();

    CHECK(registry->find("base64_secret") == nullptr);
    CHECK(registry->find("hex_secret") != nullptr);
    CHECK(registry->detectors().size() == PatternRegistry::defaults()->detectors().size() - 1);
}

TEST_CASE("Key-derived detectors need sensitive keys", "[registry]") {
    const auto registry = PatternRegistry::Builder().add_builtin_detectors().build();

    CHECK(registry->sensitive_keys().empty());
    CHECK(registry->find("sensitive_assignment") == nullptr);
    CHECK(registry->find("quoted_sensitive_assignment") == nullptr);
    CHECK(registry->find("github_token") != nullptr);
}

TEST_CASE("Custom sensitive keys feed the assignment detector", "[registry]") {
    const auto registry = PatternRegistry::Builder()
        .add_builtin_detectors()
        .add_sensitive_key("session_id")
        .build();

    const auto* assignment = registry->find("sensitive_assignment");
    REQUIRE(assignment != nullptr);

    std::smatch match;
    const std::string line = "resumed SESSION-ID=4f2a9c";
    REQUIRE(std::regex_search(line, match, assignment->pattern));
    CHECK(match[3].str() == "4f2a9c");

    CHECK_FALSE(std::regex_search(std::string("password=abc"), assignment->pattern));
}

// ============================================================================
// Sensitive keys
// ============================================================================

TEST_CASE("SensitiveKeySet normalization", "[registry]") {
    CHECK(SensitiveKeySet::normalize("X-Api.Key Name") == "x_api_key_name");
    CHECK(SensitiveKeySet::normalize("GITHUB_TOKEN") == "github_token");
    CHECK(SensitiveKeySet::normalize("").empty());
}

TEST_CASE("SensitiveKeySet matching", "[registry]") {
    const auto& keys = PatternRegistry::defaults()->sensitive_keys();

    SECTION("Exact and case-insensitive") {
        CHECK(keys.is_sensitive("password"));
        CHECK(keys.is_sensitive("PASSWORD"));
        CHECK(keys.is_sensitive("Authorization"));
        CHECK(keys.is_sensitive("cookie"));
    }

    SECTION("Substring after normalization") {
        CHECK(keys.is_sensitive("X-Api-Key"));
        CHECK(keys.is_sensitive("github_token"));
        CHECK(keys.is_sensitive("db.password"));
        CHECK(keys.is_sensitive("client secret"));
        CHECK(keys.is_sensitive("AWS_ACCESS_KEY_ID"));
    }

    SECTION("Benign keys") {
        CHECK_FALSE(keys.is_sensitive("user"));
        CHECK_FALSE(keys.is_sensitive("repository"));
        CHECK_FALSE(keys.is_sensitive("pass"));
        CHECK_FALSE(keys.is_sensitive("key"));
        CHECK_FALSE(keys.is_sensitive(""));
    }
}

TEST_CASE("SensitiveKeySet deduplicates normalized entries", "[registry]") {
    const SensitiveKeySet keys({"API-KEY", "api_key", "Api.Key", ""});
    CHECK(keys.size() == 1);
    CHECK(keys.entries().front() == "api_key");
}

TEST_CASE("Assignment pattern escapes regex metacharacters", "[registry]") {
    const SensitiveKeySet keys({"my+key"});
    const std::regex rx(PatternRegistry::assignment_pattern(keys),
                        std::regex::ECMAScript | std::regex::icase);

    std::smatch match;
    const std::string line = "my+key=value1";
    REQUIRE(std::regex_search(line, match, rx));
    CHECK(match[3].str() == "value1");

    CHECK_FALSE(std::regex_search(std::string("myykey=value1"), rx));
}
