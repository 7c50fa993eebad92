#include <gtest/gtest.h>
#include <codesim/analysis/normalizer.hpp>
#include <codesim/analysis/tokenizer.hpp>

using namespace codesim;
using namespace codesim::analysis;

class NormalizerTest : public ::testing::Test {
protected:
    NormalizerTest()
        : keywords_(KeywordSet::java_and_javascript())
        , tokenizer_(keywords_)
        , normalizer_(keywords_) {}

    CanonicalSequence canonical(const std::string& source) {
        return normalizer_.normalize(tokenizer_.tokenize(source).tokens).sequence;
    }

    KeywordSet keywords_;
    Tokenizer tokenizer_;
    Normalizer normalizer_;
};

// ============================================================================
// Rewrite Rules
// ============================================================================

TEST_F(NormalizerTest, EmptyInput) {
    auto result = normalizer_.normalize({});
    EXPECT_TRUE(result.sequence.empty());
    EXPECT_EQ(result.context.size(), 0u);
}

TEST_F(NormalizerTest, ClassBodyScenario) {
    auto seq = canonical("class Foo { return 42; }");
    EXPECT_EQ(seq, (CanonicalSequence{"class", "ID1", "{", "return", "NUM", ";", "}"}));
}

TEST_F(NormalizerTest, StringsBecomeStr) {
    auto seq = canonical("log(\"hello\", 'x', `t`);");
    EXPECT_EQ(seq, (CanonicalSequence{"ID1", "(", "STR", ",", "STR", ",", "STR", ")", ";"}));
}

TEST_F(NormalizerTest, NumbersBecomeNum) {
    auto seq = canonical("x = 3.14 + 7");
    EXPECT_EQ(seq, (CanonicalSequence{"ID1", "=", "NUM", "+", "NUM"}));
}

TEST_F(NormalizerTest, KeywordsAndOperatorsUnchanged) {
    auto seq = canonical("if (a >= b) { while (true) break; }");
    EXPECT_EQ(seq, (CanonicalSequence{"if", "(", "ID1", ">=", "ID2", ")", "{",
                                      "while", "(", "true", ")", "break", ";", "}"}));
}

TEST_F(NormalizerTest, RepeatedIdentifierKeepsItsName) {
    auto seq = canonical("a = b; b = a; c = a;");
    EXPECT_EQ(seq, (CanonicalSequence{"ID1", "=", "ID2", ";", "ID2", "=", "ID1", ";",
                                      "ID3", "=", "ID1", ";"}));
}

// ============================================================================
// Context
// ============================================================================

TEST_F(NormalizerTest, MappingInFirstOccurrenceOrder) {
    auto result = normalizer_.normalize(
        tokenizer_.tokenize("zeta = alpha + zeta * mid;").tokens);

    const auto& map = result.context.mappings();
    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map[0], std::make_pair(std::string("zeta"), std::string("ID1")));
    EXPECT_EQ(map[1], std::make_pair(std::string("alpha"), std::string("ID2")));
    EXPECT_EQ(map[2], std::make_pair(std::string("mid"), std::string("ID3")));
    EXPECT_EQ(result.context.next_id(), 4);
}

TEST_F(NormalizerTest, FreshContextPerFile) {
    auto first = normalizer_.normalize(tokenizer_.tokenize("foo bar").tokens);
    auto second = normalizer_.normalize(tokenizer_.tokenize("baz").tokens);

    EXPECT_EQ(first.sequence, (CanonicalSequence{"ID1", "ID2"}));
    EXPECT_EQ(second.sequence, (CanonicalSequence{"ID1"}));
}

TEST_F(NormalizerTest, CallerOwnedContextContinuesNumbering) {
    NormalizationContext ctx;
    normalizer_.normalize(tokenizer_.tokenize("a b").tokens, ctx);
    auto seq = normalizer_.normalize(tokenizer_.tokenize("c a").tokens, ctx);
    EXPECT_EQ(seq, (CanonicalSequence{"ID3", "ID1"}));
}

// ============================================================================
// Invariance
// ============================================================================

TEST_F(NormalizerTest, RenameInvariance) {
    const std::string original =
        "public int sum(int[] values) { int total = 0; "
        "for (int i = 0; i < values.length; i++) { total += values[i]; } return total; }";
    const std::string renamed =
        "public int add(int[] xs) { int acc = 0; "
        "for (int k = 0; k < xs.size; k++) { acc += xs[k]; } return acc; }";

    EXPECT_EQ(canonical(original), canonical(renamed));
}

TEST_F(NormalizerTest, LiteralInvariance) {
    EXPECT_EQ(canonical("f(\"abc\", 1);"), canonical("f('zzz', 99.5);"));
}

TEST_F(NormalizerTest, StructuralChangeIsVisible) {
    EXPECT_NE(canonical("if (a) { b(); }"), canonical("while (a) { b(); }"));
}

TEST_F(NormalizerTest, NumericShapes) {
    EXPECT_TRUE(Normalizer::is_numeric("0"));
    EXPECT_TRUE(Normalizer::is_numeric("12.50"));
    EXPECT_FALSE(Normalizer::is_numeric("1."));
    EXPECT_FALSE(Normalizer::is_numeric(".5"));
    EXPECT_FALSE(Normalizer::is_numeric("1e5"));
    EXPECT_FALSE(Normalizer::is_numeric(""));
}

TEST_F(NormalizerTest, IdentifierShapes) {
    EXPECT_TRUE(Normalizer::is_identifier("_x1"));
    EXPECT_FALSE(Normalizer::is_identifier("1x"));
    EXPECT_FALSE(Normalizer::is_identifier("a-b"));
}
