#include <gtest/gtest.h>

#include "cache/fingerprint.hpp"

namespace sandforge::cache {
namespace {

const nlohmann::json kContext = {{"items", {{{"json", {{"value", 5}}}}}}};

TEST(FingerprintTest, IsSixtyFourLowercaseHexChars) {
    const auto fp = Fingerprint("python", "Python 3.12.1", "result = 1\n", kContext);
    ASSERT_EQ(fp.size(), 64u);
    for (const char c : fp) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(FingerprintTest, IsDeterministic) {
    EXPECT_EQ(Fingerprint("python", "3.12", "result = 1\n", kContext),
              Fingerprint("python", "3.12", "result = 1\n", kContext));
}

TEST(FingerprintTest, IgnoresLineEndingsAndTrailingBlankLines) {
    EXPECT_EQ(Fingerprint("python", "3.12", "x = 1\nresult = x\n", kContext),
              Fingerprint("python", "3.12", "x = 1\r\nresult = x\r\n\n  \n\t\n", kContext));
}

TEST(FingerprintTest, WhitespaceInsideStringLiteralsIsSignificant) {
    EXPECT_NE(Fingerprint("python", "3.12", "result = '''x  \ny'''\n", kContext),
              Fingerprint("python", "3.12", "result = '''x\ny'''\n", kContext));
    EXPECT_NE(Fingerprint("python", "3.12", "result = 'a \\\n'\n", kContext),
              Fingerprint("python", "3.12", "result = 'a\\\n'\n", kContext));
}

TEST(FingerprintTest, KeyOrderInContextDoesNotMatter) {
    const auto a = nlohmann::json::parse(R"({"a": 1, "b": {"y": 2, "x": 3}})");
    const auto b = nlohmann::json::parse(R"({"b": {"x": 3, "y": 2}, "a": 1})");
    EXPECT_EQ(Fingerprint("python", "3.12", "result = a\n", a),
              Fingerprint("python", "3.12", "result = a\n", b));
}

TEST(FingerprintTest, EveryComponentChangesTheFingerprint) {
    const auto base = Fingerprint("python", "3.12", "result = 1\n", kContext);
    EXPECT_NE(base, Fingerprint("python", "3.13", "result = 1\n", kContext));
    EXPECT_NE(base, Fingerprint("python3", "3.12", "result = 1\n", kContext));
    EXPECT_NE(base, Fingerprint("python", "3.12", "result = 2\n", kContext));
    EXPECT_NE(base, Fingerprint("python", "3.12", "result = 1\n", nlohmann::json::object()));
}

TEST(FingerprintTest, LengthPrefixingSeparatesFields) {
    EXPECT_NE(Fingerprint("python", "3.1", "2\n", kContext),
              Fingerprint("python", "3.12", "\n", kContext));
}

TEST(NormalizeSourceTest, FoldsLineEndingsAndStripsTrailingBlankLines) {
    EXPECT_EQ(NormalizeSource("a  \r\nb\t\n\n \n\n"), "a  \nb\t\n");
    EXPECT_EQ(NormalizeSource("a"), "a\n");
    EXPECT_EQ(NormalizeSource(""), "");
}

TEST(NormalizeSourceTest, KeepsLeadingIndentation) {
    EXPECT_EQ(NormalizeSource("if x:\n    y = 1\n"), "if x:\n    y = 1\n");
}

TEST(CanonicalContextTest, NullIsEmptyObject) {
    EXPECT_EQ(CanonicalContext(nullptr), "{}");
    EXPECT_EQ(CanonicalContext(nlohmann::json::object()), "{}");
}

}  // namespace
}  // namespace sandforge::cache
