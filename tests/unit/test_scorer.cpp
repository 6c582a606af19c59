#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "engine/context_filter.h"
#include "engine/pattern_matcher.h"
#include "engine/scorer.h"
#include "test_support.h"

using namespace Shield;
using namespace Shield::Testing;

class ScorerTest : public LoggedTest {
protected:
    ScorerTest() : LoggedTest("scorer"), config_(defaultConfig()) {}

    void SetUp() override {
        LoggedTest::SetUp();
        catalog_ = loadDefaultCatalog();
        ASSERT_NE(nullptr, catalog_);
    }

    auto scoreUnit(const SourceUnit& unit, const RuleCatalog& catalog,
                   std::vector<Diagnostic>* diagnostics) -> std::vector<Finding> {
        std::vector<Match> raw;
        PatternMatcher::scan(unit, catalog, &raw);
        const ContextFilter filter(config_);
        const Scorer scorer(config_);
        std::vector<Finding> findings;
        scorer.score(filter.filter(raw), unit, &findings, diagnostics);
        return findings;
    }

    auto scoreUnit(const SourceUnit& unit) -> std::vector<Finding> {
        std::vector<Diagnostic> diagnostics;
        auto findings = scoreUnit(unit, *catalog_, &diagnostics);
        EXPECT_TRUE(diagnostics.empty());
        return findings;
    }

    ScannerConfig config_;
    std::unique_ptr<const RuleCatalog> catalog_;
};

TEST_F(ScorerTest, DecisionTableBands) {
    bool anomaly = true;
    EXPECT_EQ(SeverityBand::CRITICAL,
              Scorer::bandFor(Category::HARDCODED_CREDENTIALS, Factor::CREDENTIAL_LITERAL, true, false, &anomaly));
    EXPECT_FALSE(anomaly);
    EXPECT_EQ(SeverityBand::HIGH,
              Scorer::bandFor(Category::HARDCODED_CREDENTIALS, Factor::CREDENTIAL_LITERAL, false, false, &anomaly));
    EXPECT_EQ(SeverityBand::CRITICAL,
              Scorer::bandFor(Category::SSL_VERIFICATION_DISABLED, Factor::EXPLICIT_VERIFY_DISABLED, true, false,
                              &anomaly));
    EXPECT_EQ(SeverityBand::HIGH,
              Scorer::bandFor(Category::SSL_VERIFICATION_DISABLED, Factor::PLAIN_HTTP_ENDPOINT, true, false,
                              &anomaly));
    EXPECT_EQ(SeverityBand::CRITICAL,
              Scorer::bandFor(Category::INPUT_VALIDATION_MISSING, Factor::UNVALIDATED_INPUT, true, true, &anomaly));
    EXPECT_EQ(SeverityBand::MEDIUM,
              Scorer::bandFor(Category::INPUT_VALIDATION_MISSING, Factor::UNVALIDATED_INPUT, true, false, &anomaly));
    EXPECT_EQ(SeverityBand::HIGH,
              Scorer::bandFor(Category::INFORMATION_DISCLOSURE_IN_LOGS, Factor::CREDENTIAL_IN_LOG, true, false,
                              &anomaly));
    EXPECT_EQ(SeverityBand::MEDIUM,
              Scorer::bandFor(Category::INFORMATION_DISCLOSURE_IN_LOGS, Factor::VERBOSE_EXCEPTION_LOG, true, false,
                              &anomaly));
    EXPECT_EQ(SeverityBand::MEDIUM,
              Scorer::bandFor(Category::INSUFFICIENT_ERROR_HANDLING, Factor::BARE_CATCH, true, false, &anomaly));
    EXPECT_EQ(SeverityBand::LOW,
              Scorer::bandFor(Category::INSUFFICIENT_ERROR_HANDLING, Factor::MISSING_TIMEOUT, true, false, &anomaly));
    EXPECT_FALSE(anomaly);
}

TEST_F(ScorerTest, UnexpectedFactorFallsToLowestBand) {
    bool anomaly = false;
    EXPECT_EQ(SeverityBand::HIGH,
              Scorer::bandFor(Category::HARDCODED_CREDENTIALS, Factor::MISSING_TIMEOUT, true, false, &anomaly));
    EXPECT_TRUE(anomaly);

    anomaly = false;
    EXPECT_EQ(SeverityBand::LOW,
              Scorer::bandFor(Category::INSUFFICIENT_ERROR_HANDLING, Factor::CREDENTIAL_LITERAL, true, false,
                              &anomaly));
    EXPECT_TRUE(anomaly);

    anomaly = false;
    EXPECT_EQ(SeverityBand::MEDIUM,
              Scorer::bandFor(Category::INPUT_VALIDATION_MISSING, Factor::NONE, true, true, &anomaly));
    EXPECT_TRUE(anomaly);
}

TEST_F(ScorerTest, ScoreStaysInsideBand) {
    EXPECT_EQ(10, Scorer::scoreInBand(SeverityBand::CRITICAL, 0.95));
    EXPECT_EQ(9, Scorer::scoreInBand(SeverityBand::CRITICAL, 0.1));
    EXPECT_EQ(8, Scorer::scoreInBand(SeverityBand::HIGH, 0.95));
    EXPECT_EQ(6, Scorer::scoreInBand(SeverityBand::MEDIUM, 0.7));
    EXPECT_EQ(4, Scorer::scoreInBand(SeverityBand::MEDIUM, 0.3));
    EXPECT_EQ(2, Scorer::scoreInBand(SeverityBand::LOW, 0.5));
    EXPECT_EQ(3, Scorer::scoreInBand(SeverityBand::LOW, 1.0));
    EXPECT_EQ(1, Scorer::scoreInBand(SeverityBand::LOW, 0.0));

    for (size_t b = 0; b < BAND_COUNT; ++b) {
        const auto band = static_cast<SeverityBand>(b);
        for (int step = 0; step <= 20; ++step) {
            const uint8_t score = Scorer::scoreInBand(band, step / 20.0);
            EXPECT_EQ(band, bandForScore(score)) << bandName(band) << " step " << step;
        }
    }
}

TEST_F(ScorerTest, TestPathsAreNotProduction) {
    const Scorer scorer(config_);
    EXPECT_TRUE(scorer.isProductionPath("src/app.py"));
    EXPECT_TRUE(scorer.isProductionPath("contest/app.py"));
    EXPECT_FALSE(scorer.isProductionPath("tests/app.py"));
    EXPECT_FALSE(scorer.isProductionPath("app/test_config.py"));
    EXPECT_FALSE(scorer.isProductionPath("app/config_test.py"));
    EXPECT_FALSE(scorer.isProductionPath("pkg\\Testing\\client.py"));
}

TEST_F(ScorerTest, EntryPointByHandlerName) {
    const Scorer scorer(config_);
    const SourceUnit unit("app/api.py",
                          "def handle_create(request):\n"
                          "    name = request.args.get(\"name\")\n"
                          "    return name\n");
    EXPECT_TRUE(scorer.isEntryPoint(unit, 2));
}

TEST_F(ScorerTest, EntryPointByDecorator) {
    const Scorer scorer(config_);
    const SourceUnit unit("app/server.py",
                          "@mcp.tool()\n"
                          "async def create_server(name: str):\n"
                          "    data = request.json\n");
    EXPECT_TRUE(scorer.isEntryPoint(unit, 3));
}

TEST_F(ScorerTest, NearestDefinitionDecides) {
    const Scorer scorer(config_);
    const SourceUnit unit("app/server.py",
                          "def handle_list():\n"
                          "    return []\n"
                          "\n"
                          "def _parse_args():\n"
                          "    return sys.argv[1]\n");
    EXPECT_TRUE(scorer.isEntryPoint(unit, 2));
    EXPECT_FALSE(scorer.isEntryPoint(unit, 5));
}

TEST_F(ScorerTest, CLikeHandlerSignature) {
    const Scorer scorer(config_);
    const SourceUnit unit("src/routes.cpp",
                          "void login_handler(const Request& req) {\n"
                          "    auto user = req.body;\n"
                          "}\n");
    EXPECT_TRUE(scorer.isEntryPoint(unit, 2));
}

TEST_F(ScorerTest, HardcodedCredentialInProduction) {
    const SourceUnit unit("src/settings.py", "password = \"secret123\"\n");
    const auto findings = scoreUnit(unit);

    ASSERT_EQ(1u, findings.size());
    const Finding& f = findings[0];
    EXPECT_EQ(Category::HARDCODED_CREDENTIALS, f.category);
    EXPECT_EQ(SeverityTier::HIGH, f.tier);
    EXPECT_EQ(SeverityBand::CRITICAL, f.band);
    EXPECT_EQ(10, f.score);
    EXPECT_STREQ("CRED-001", f.rule_id);
    EXPECT_STREQ("credential-assignment", f.indicator_id);
    EXPECT_EQ("src/settings.py", f.unit_id);
    EXPECT_EQ(1u, f.line);
    EXPECT_EQ(16u, std::strlen(f.fingerprint));
    EXPECT_NE(nullptr, std::strstr(f.rationale, "Review: "));
    EXPECT_FALSE(f.anomaly);
    EXPECT_FALSE(f.low_confidence);
}

TEST_F(ScorerTest, HardcodedCredentialInTestsIsHigh) {
    const SourceUnit unit("tests/development/insecure2.py",
                          "auth = {'password': 'super-secret-password'}\n");
    const auto findings = scoreUnit(unit);

    ASSERT_EQ(1u, findings.size());
    EXPECT_EQ(SeverityBand::HIGH, findings[0].band);
    EXPECT_EQ(8, findings[0].score);
}

TEST_F(ScorerTest, InputAtEntryPointIsCritical) {
    const SourceUnit handler("src/api.py",
                             "def handle_create(request):\n"
                             "    name = request.args.get(\"name\")\n"
                             "    return name\n");
    const SourceUnit helper("src/api.py",
                            "def build(request):\n"
                            "    name = request.args.get(\"name\")\n"
                            "    return name\n");

    const auto critical = scoreUnit(handler);
    ASSERT_EQ(1u, critical.size());
    EXPECT_EQ(Category::INPUT_VALIDATION_MISSING, critical[0].category);
    EXPECT_EQ(SeverityBand::CRITICAL, critical[0].band);
    EXPECT_EQ(10, critical[0].score);

    const auto medium = scoreUnit(helper);
    ASSERT_EQ(1u, medium.size());
    EXPECT_EQ(SeverityBand::MEDIUM, medium[0].band);
    EXPECT_EQ(6, medium[0].score);
}

TEST_F(ScorerTest, LowConfidenceCatchScoresLower) {
    const SourceUnit lone("src/worker.py", "except:\n    pass\n");
    const auto findings = scoreUnit(lone);

    ASSERT_EQ(1u, findings.size());
    EXPECT_EQ(SeverityBand::MEDIUM, findings[0].band);
    EXPECT_EQ(4, findings[0].score);
    EXPECT_TRUE(findings[0].low_confidence);
    EXPECT_NE(nullptr, std::strstr(findings[0].rationale, "no enclosing try block"));
}

TEST_F(ScorerTest, ContextMatchesProduceNoFindings) {
    const SourceUnit unit("src/worker.py",
                          "try:\n"
                          "    work()\n"
                          "except ValueError:\n"
                          "    recover()\n");
    EXPECT_TRUE(scoreUnit(unit).empty());
}

TEST_F(ScorerTest, MismatchedFactorReportsAnomaly) {
    auto rules = minimalRules();
    rules[0] = ruleJson("CRED-T", "HardcodedCredentials", "HIGH",
                        keywordIndicator("cred", "missing_timeout", "hunter2"));
    auto catalog = loadCatalogString(catalogJson(rules));
    ASSERT_NE(nullptr, catalog);

    const SourceUnit unit("src/app.py", "login(hunter2)\n");
    std::vector<Diagnostic> diagnostics;
    const auto findings = scoreUnit(unit, *catalog, &diagnostics);

    ASSERT_EQ(1u, findings.size());
    EXPECT_TRUE(findings[0].anomaly);
    EXPECT_EQ(SeverityBand::HIGH, findings[0].band);
    EXPECT_EQ(8, findings[0].score);

    ASSERT_EQ(1u, diagnostics.size());
    EXPECT_EQ(DiagnosticKind::SCORER_ANOMALY, diagnostics[0].kind);
    EXPECT_EQ(1u, diagnostics[0].line);
    EXPECT_EQ("src/app.py", diagnostics[0].unit_id);
}

TEST_F(ScorerTest, FingerprintIgnoresLineAndIndentation) {
    Finding a{};
    std::strcpy(a.rule_id, "CRED-001");
    std::strcpy(a.indicator_id, "credential-assignment");
    a.unit_id = "src/settings.py";
    std::strcpy(a.excerpt, "password = \"secret123\"");
    a.line = 3;

    Finding b = a;
    std::strcpy(b.excerpt, "password   =  \"secret123\"");
    b.line = 40;

    Finding c = a;
    c.unit_id = "src/other.py";

    char fa[FINGERPRINT_LEN + 1];
    char fb[FINGERPRINT_LEN + 1];
    char fc[FINGERPRINT_LEN + 1];
    ASSERT_TRUE(Scorer::fingerprint(a, fa, sizeof(fa)));
    ASSERT_TRUE(Scorer::fingerprint(b, fb, sizeof(fb)));
    ASSERT_TRUE(Scorer::fingerprint(c, fc, sizeof(fc)));

    EXPECT_STREQ(fa, fb);
    EXPECT_STRNE(fa, fc);

    char small[8];
    EXPECT_FALSE(Scorer::fingerprint(a, small, sizeof(small)));
}
