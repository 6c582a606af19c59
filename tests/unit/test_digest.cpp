#include <gtest/gtest.h>

#include <cstring>
#include <initializer_list>
#include <string>

#include "common/digest.h"
#include "test_support.h"

using namespace Shield::Common;
using Shield::Testing::LoggedTest;

class DigestTest : public LoggedTest {
protected:
    DigestTest() : LoggedTest("digest") {}
};

TEST_F(DigestTest, KnownVectors) {
    char hex[SHA256_HEX_SIZE];
    ASSERT_TRUE(sha256Hex("abc", hex, sizeof(hex)));
    EXPECT_STREQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", hex);

    ASSERT_TRUE(sha256Hex("", hex, sizeof(hex)));
    EXPECT_STREQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", hex);
}

TEST_F(DigestTest, RejectsShortBuffer) {
    char small[SHA256_HEX_SIZE - 1];
    EXPECT_FALSE(sha256Hex("abc", small, sizeof(small)));
    EXPECT_FALSE(sha256Hex("abc", nullptr, SHA256_HEX_SIZE));
}

TEST_F(DigestTest, FieldsAreFramed) {
    char ab_c[SHA256_HEX_SIZE];
    char a_bc[SHA256_HEX_SIZE];

    Sha256Builder first;
    ASSERT_TRUE(first.addField("ab"));
    ASSERT_TRUE(first.addField("c"));
    ASSERT_TRUE(first.finishHex(ab_c, sizeof(ab_c)));

    Sha256Builder second;
    ASSERT_TRUE(second.addField("a"));
    ASSERT_TRUE(second.addField("bc"));
    ASSERT_TRUE(second.finishHex(a_bc, sizeof(a_bc)));

    EXPECT_STRNE(ab_c, a_bc);
    EXPECT_EQ(64u, std::strlen(ab_c));
}

TEST_F(DigestTest, BuilderIsDeterministic) {
    char one[SHA256_HEX_SIZE];
    char two[SHA256_HEX_SIZE];
    for (char* out : {one, two}) {
        Sha256Builder builder;
        ASSERT_TRUE(builder.addField("CRED-001"));
        ASSERT_TRUE(builder.addField("src/settings.py"));
        ASSERT_TRUE(builder.finishHex(out, SHA256_HEX_SIZE));
    }
    EXPECT_STREQ(one, two);
}

TEST_F(DigestTest, FinishedBuilderRefusesMore) {
    char hex[SHA256_HEX_SIZE];
    Sha256Builder builder;
    ASSERT_TRUE(builder.addField("x"));
    ASSERT_TRUE(builder.finishHex(hex, sizeof(hex)));

    EXPECT_FALSE(builder.addField("y"));
    EXPECT_FALSE(builder.finishHex(hex, sizeof(hex)));
}
