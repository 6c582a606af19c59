#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "engine/context_filter.h"
#include "engine/pattern_matcher.h"
#include "test_support.h"

using namespace Shield;
using namespace Shield::Testing;

class ContextFilterTest : public LoggedTest {
protected:
    ContextFilterTest() : LoggedTest("context_filter"), config_(defaultConfig()) {}

    void SetUp() override {
        LoggedTest::SetUp();
        catalog_ = loadDefaultCatalog();
        ASSERT_NE(nullptr, catalog_);
    }

    auto rawMatches(const SourceUnit& unit) -> std::vector<Match> {
        std::vector<Match> out;
        PatternMatcher::scan(unit, *catalog_, &out);
        return out;
    }

    auto filtered(const SourceUnit& unit) -> std::vector<Match> {
        const ContextFilter filter(config_);
        return filter.filter(rawMatches(unit));
    }

    static auto countCategory(const std::vector<Match>& matches, Category category) -> size_t {
        size_t n = 0;
        for (const Match& m : matches) {
            if (m.rule->category == category && m.isSignal()) ++n;
        }
        return n;
    }

    ScannerConfig config_;
    std::unique_ptr<const RuleCatalog> catalog_;
};

TEST_F(ContextFilterTest, WholeLineCommentDropped) {
    const SourceUnit unit("app/settings.py", "# password = \"secret123\"\n");
    EXPECT_FALSE(rawMatches(unit).empty());
    EXPECT_TRUE(filtered(unit).empty());
}

TEST_F(ContextFilterTest, TrailingCommentDropped) {
    const SourceUnit unit("app/settings.py", "x = 1  # password = \"secret123\"\n");
    EXPECT_FALSE(rawMatches(unit).empty());
    EXPECT_TRUE(filtered(unit).empty());
}

TEST_F(ContextFilterTest, DocstringBodyDropped) {
    const SourceUnit unit("app/settings.py",
                          "\"\"\"\n"
                          "Example: password = \"secret123\"\n"
                          "\"\"\"\n"
                          "password = \"realvalue9\"\n");
    const auto kept = filtered(unit);
    ASSERT_EQ(1u, kept.size());
    EXPECT_EQ(4u, kept[0].line);
}

TEST_F(ContextFilterTest, CodeAfterMultiLineStringIsScanned) {
    const SourceUnit unit("app/queries.py",
                          "QUERY = \"\"\"\n"
                          "SELECT id FROM servers\n"
                          "\"\"\"\n"
                          "password = \"hunter2\"\n"
                          "def main():\n"
                          "    pass\n");
    for (uint32_t l = 1; l <= unit.lineCount(); ++l) {
        EXPECT_FALSE(unit.lineInfo(l).comment_line) << "line " << l;
    }

    const auto kept = filtered(unit);
    ASSERT_EQ(1u, countCategory(kept, Category::HARDCODED_CREDENTIALS));
    for (const Match& m : kept) {
        if (m.rule->category == Category::HARDCODED_CREDENTIALS) {
            EXPECT_EQ(4u, m.line);
        }
    }
}

TEST_F(ContextFilterTest, StringOpenedMidLineThenDocstring) {
    const SourceUnit unit("app/cli.py",
                          "HELP = '''Usage:\n"
                          "  run the client\n"
                          "'''\n"
                          "def run():\n"
                          "    \"\"\"Connects with\n"
                          "    password = \"secret123\"\n"
                          "    \"\"\"\n"
                          "    token = \"tok-live-8812\"\n");
    EXPECT_FALSE(unit.lineInfo(1).comment_line);
    EXPECT_FALSE(unit.lineInfo(2).comment_line);
    EXPECT_FALSE(unit.lineInfo(3).comment_line);
    EXPECT_FALSE(unit.lineInfo(4).comment_line);
    EXPECT_TRUE(unit.lineInfo(5).comment_line);
    EXPECT_TRUE(unit.lineInfo(6).comment_line);
    EXPECT_TRUE(unit.lineInfo(7).comment_line);
    EXPECT_FALSE(unit.lineInfo(8).comment_line);

    const auto kept = filtered(unit);
    ASSERT_EQ(1u, countCategory(kept, Category::HARDCODED_CREDENTIALS));
    for (const Match& m : kept) {
        if (m.rule->category == Category::HARDCODED_CREDENTIALS) {
            EXPECT_EQ(8u, m.line);
        }
    }
}

TEST_F(ContextFilterTest, DashCommentsOnlyForDashLanguages) {
    const SourceUnit sql("db/seed.sql", "-- password = \"secret123\"\nSELECT 1; -- note\n");
    const SourceUnit sh("scripts/deploy.sh", "deploy \\\n  --password \"x\" \\\n  --verbose\n");

    EXPECT_EQ(CommentStyle::DASH, sql.commentStyle());
    EXPECT_TRUE(sql.lineInfo(1).comment_line);
    EXPECT_FALSE(sql.lineInfo(2).comment_line);
    EXPECT_EQ(10u, sql.lineInfo(2).comment_column);
    EXPECT_FALSE(rawMatches(sql).empty());
    EXPECT_EQ(0u, countCategory(filtered(sql), Category::HARDCODED_CREDENTIALS));

    EXPECT_EQ(CommentStyle::HASH, sh.commentStyle());
    EXPECT_FALSE(sh.lineInfo(2).comment_line);
    EXPECT_FALSE(sh.lineInfo(3).comment_line);
    EXPECT_EQ(NO_COLUMN, sh.lineInfo(2).comment_column);
}

TEST_F(ContextFilterTest, SlashCommentOnlyForSlashLanguages) {
    const SourceUnit js("web/client.js", "// const password = \"secret123\";\n");
    const SourceUnit py("app/client.py", "url = \"https://host//path\"; password = \"secret123\"\n");

    EXPECT_EQ(CommentStyle::SLASH, js.commentStyle());
    EXPECT_EQ(CommentStyle::HASH, py.commentStyle());
    EXPECT_TRUE(filtered(js).empty());
    EXPECT_EQ(1u, countCategory(filtered(py), Category::HARDCODED_CREDENTIALS));
}

TEST_F(ContextFilterTest, HashInsideStringIsNotComment) {
    const SourceUnit unit("app/settings.py", "password = \"abc#123xyz\"\n");
    const auto kept = filtered(unit);
    ASSERT_EQ(1u, kept.size());
    EXPECT_STREQ("abc#123xyz", kept[0].literal_value);
}

TEST_F(ContextFilterTest, FixturePathDropped) {
    const SourceUnit docs("docs/example_config.py", "password = \"secret123\"\n");
    const SourceUnit samples("project/samples/client.py", "password = \"secret123\"\n");
    const SourceUnit tests("tests/test_client.py", "password = \"secret123\"\n");

    EXPECT_TRUE(filtered(docs).empty());
    EXPECT_TRUE(filtered(samples).empty());
    EXPECT_EQ(1u, filtered(tests).size());
}

TEST_F(ContextFilterTest, FixtureSegmentIgnoresFileName) {
    const ContextFilter filter(config_);
    EXPECT_TRUE(filter.isFixturePath("docs/readme.py"));
    EXPECT_TRUE(filter.isFixturePath("a\\Examples\\b.py"));
    EXPECT_FALSE(filter.isFixturePath("app/docs.py"));
    EXPECT_FALSE(filter.isFixturePath("app/documentation/x.py"));
}

TEST_F(ContextFilterTest, PlaceholderLiteralsDropped) {
    const SourceUnit unit("app/settings.py",
                          "password = \"changeme\"\n"
                          "passwd = \"\"\n"
                          "api_key = \"your_api_key_here\"\n"
                          "token = \"xxxxxxxx\"\n"
                          "secret = \"<your-secret>\"\n"
                          "client_secret = \"${CLIENT_SECRET}\"\n");
    EXPECT_EQ(6u, rawMatches(unit).size());
    EXPECT_TRUE(filtered(unit).empty());
}

TEST_F(ContextFilterTest, PlaceholderRecognition) {
    const ContextFilter filter(config_);

    EXPECT_TRUE(filter.isPlaceholder("CHANGEME"));
    EXPECT_TRUE(filter.isPlaceholder("  dummy "));
    EXPECT_TRUE(filter.isPlaceholder("example-token"));
    EXPECT_TRUE(filter.isPlaceholder("*****"));
    EXPECT_TRUE(filter.isPlaceholder("XXXX"));
    EXPECT_TRUE(filter.isPlaceholder("<password>"));
    EXPECT_TRUE(filter.isPlaceholder("${DB_PASS}"));
    EXPECT_TRUE(filter.isPlaceholder("Your_Token"));

    EXPECT_FALSE(filter.isPlaceholder("hunter22"));
    EXPECT_FALSE(filter.isPlaceholder("examples123"));
    EXPECT_FALSE(filter.isPlaceholder("xxy"));
    EXPECT_FALSE(filter.isPlaceholder("<unterminated"));
}

TEST_F(ContextFilterTest, SameRuleSameLineKeepsStrongest) {
    const SourceUnit unit("app/api.py", "requests.get(\"http://api.cloud.net\", verify=False)\n");

    const auto raw = rawMatches(unit);
    EXPECT_EQ(2u, countCategory(raw, Category::SSL_VERIFICATION_DISABLED));

    const auto kept = filtered(unit);
    ASSERT_EQ(1u, countCategory(kept, Category::SSL_VERIFICATION_DISABLED));
    for (const Match& m : kept) {
        if (m.rule->category == Category::SSL_VERIFICATION_DISABLED) {
            EXPECT_STREQ("verify-disabled", m.indicator().id);
        }
    }
    // A different rule on the same line is independent
    EXPECT_EQ(1u, countCategory(kept, Category::INSUFFICIENT_ERROR_HANDLING));
}

TEST_F(ContextFilterTest, DifferentiatedHandlerSuppressesBroadCatch) {
    const SourceUnit unit("app/worker.py",
                          "try:\n"
                          "    call()\n"
                          "except ValueError:\n"
                          "    handle()\n"
                          "except Exception as e:\n"
                          "    pass\n");
    EXPECT_EQ(1u, countCategory(rawMatches(unit), Category::INSUFFICIENT_ERROR_HANDLING));
    EXPECT_EQ(0u, countCategory(filtered(unit), Category::INSUFFICIENT_ERROR_HANDLING));
}

TEST_F(ContextFilterTest, LoneCatchIsLowConfidence) {
    const SourceUnit unit("app/worker.py", "except:\n    pass\n");
    const auto kept = filtered(unit);

    ASSERT_EQ(1u, kept.size());
    EXPECT_TRUE(kept[0].low_confidence);
    EXPECT_DOUBLE_EQ(0.3, kept[0].confidence);
}

TEST_F(ContextFilterTest, CatchInsideTryKeepsConfidence) {
    const SourceUnit unit("app/worker.py",
                          "try:\n"
                          "    do_work()\n"
                          "except:\n"
                          "    pass\n");
    const auto kept = filtered(unit);

    ASSERT_EQ(1u, countCategory(kept, Category::INSUFFICIENT_ERROR_HANDLING));
    for (const Match& m : kept) {
        if (m.isSignal()) {
            EXPECT_FALSE(m.low_confidence);
            EXPECT_DOUBLE_EQ(0.7, m.confidence);
        }
    }
}

TEST_F(ContextFilterTest, TryOutsideWindowDoesNotCount) {
    std::string text = "try:\n";
    for (int i = 0; i < 10; ++i) {
        text += "    step()\n";
    }
    text += "except:\n    pass\n";
    const SourceUnit unit("app/worker.py", text);

    const auto kept = filtered(unit);
    bool found = false;
    for (const Match& m : kept) {
        if (m.isSignal()) {
            found = true;
            EXPECT_TRUE(m.low_confidence);
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(ContextFilterTest, FilterIsIdempotent) {
    const SourceUnit unit("app/mixed.py",
                          "password = \"secret123\"\n"
                          "# token = \"abcdef12\"\n"
                          "requests.get(\"http://api.cloud.net\", verify=False)\n"
                          "except:\n"
                          "    pass\n"
                          "logger.info(f\"token={token}\")\n");
    const ContextFilter filter(config_);
    const auto once = filter.filter(rawMatches(unit));
    const auto twice = filter.filter(once);

    ASSERT_EQ(once.size(), twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].rule, twice[i].rule);
        EXPECT_EQ(once[i].indicator_index, twice[i].indicator_index);
        EXPECT_EQ(once[i].line, twice[i].line);
        EXPECT_DOUBLE_EQ(once[i].confidence, twice[i].confidence);
        EXPECT_EQ(once[i].low_confidence, twice[i].low_confidence);
    }
}

TEST_F(ContextFilterTest, ConfiguredPlaceholdersApply) {
    config_.classification.placeholder_values.clear();
    ASSERT_TRUE(config_.classification.placeholder_values.add("notreal"));

    const SourceUnit unit("app/settings.py",
                          "password = \"notreal\"\n"
                          "token = \"changeme\"\n");
    const auto kept = filtered(unit);
    ASSERT_EQ(1u, kept.size());
    EXPECT_EQ(2u, kept[0].line);
}
