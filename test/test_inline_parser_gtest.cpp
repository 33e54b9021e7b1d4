// Inline parser tests: bold/italic delimiter pairing and its recovery rules

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../prose/inline_parser.hpp"
#include "../lib/log.h"

using namespace prose;

class InlineParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    static Span text(const char* s) { return Span::makeText(s, StyleToken()); }
    static Span italic(const char* s) { return Span::makeItalic(s, StyleToken()); }
    static Span bold(const char* s) { return Span::makeBold({ text(s) }); }
};

// ==============================================================================
// Delimiter pairing
// ==============================================================================

TEST_F(InlineParserTest, PairingAlternatesOpenClose) {
    std::vector<Fragment> frags = pair_delimiters("a *b* c *d*", "*");
    ASSERT_EQ(frags.size(), 4u);
    EXPECT_FALSE(frags[0].delimited);
    EXPECT_EQ(frags[0].text, "a ");
    EXPECT_TRUE(frags[1].delimited);
    EXPECT_EQ(frags[1].text, "b");
    EXPECT_FALSE(frags[2].delimited);
    EXPECT_EQ(frags[2].text, " c ");
    EXPECT_TRUE(frags[3].delimited);
    EXPECT_EQ(frags[3].text, "d");
}

TEST_F(InlineParserTest, PairingWithoutDelimiter) {
    std::vector<Fragment> frags = pair_delimiters("no markup", "**");
    ASSERT_EQ(frags.size(), 1u);
    EXPECT_FALSE(frags[0].delimited);
    EXPECT_EQ(frags[0].text, "no markup");
}

TEST_F(InlineParserTest, PairingEmptyInput) {
    EXPECT_TRUE(pair_delimiters("", "*").empty());
}

// ==============================================================================
// Bold
// ==============================================================================

TEST_F(InlineParserTest, PlainText) {
    EXPECT_EQ(inline_parse("just text"), InlineSequence({ text("just text") }));
}

TEST_F(InlineParserTest, Bold) {
    EXPECT_EQ(inline_parse("**hello**"), InlineSequence({ bold("hello") }));
}

TEST_F(InlineParserTest, BoldInsideText) {
    EXPECT_EQ(inline_parse("eat **more** greens"),
              InlineSequence({ text("eat "), bold("more"), text(" greens") }));
}

TEST_F(InlineParserTest, EmptyBoldDiscarded) {
    EXPECT_EQ(inline_parse("**** world"), InlineSequence({ text(" world") }));
}

TEST_F(InlineParserTest, UnmatchedBoldDropsDelimiter) {
    EXPECT_EQ(inline_parse("**unclosed"), InlineSequence({ text("unclosed") }));
    EXPECT_EQ(inline_parse("a **b"), InlineSequence({ text("a "), text("b") }));
}

TEST_F(InlineParserTest, NoItalicsInsideBold) {
    EXPECT_EQ(inline_parse("**a *b* c**"), InlineSequence({ bold("a *b* c") }));
}

// ==============================================================================
// Italic
// ==============================================================================

TEST_F(InlineParserTest, Italic) {
    EXPECT_EQ(inline_parse("*x*"), InlineSequence({ italic("x") }));
}

TEST_F(InlineParserTest, ItalicAndBoldInterleaved) {
    EXPECT_EQ(inline_parse("a *b* **c** *d*"),
              InlineSequence({ text("a "), italic("b"), text(" "), bold("c"), text(" "), italic("d") }));
}

TEST_F(InlineParserTest, ItalicDoesNotSpanBold) {
    // each plain fragment is paired on its own
    EXPECT_EQ(inline_parse("*a **b** c*"),
              InlineSequence({ text("a "), bold("b"), text(" c") }));
}

TEST_F(InlineParserTest, LoneAsteriskDropped) {
    InlineSequence spans = inline_parse("2 * 3 = 6");
    EXPECT_EQ(spans, InlineSequence({ text("2 "), text(" 3 = 6") }));
    EXPECT_EQ(plain_text(spans), "2  3 = 6");
}

TEST_F(InlineParserTest, DelimiterOnlyInput) {
    EXPECT_TRUE(inline_parse("").empty());
    EXPECT_TRUE(inline_parse("*").empty());
    EXPECT_TRUE(inline_parse("**").empty());
    EXPECT_TRUE(inline_parse("***").empty());
    EXPECT_TRUE(inline_parse("****").empty());
}

TEST_F(InlineParserTest, DelimitersAgainstWordCharacters) {
    EXPECT_EQ(inline_parse("un*believ*able"),
              InlineSequence({ text("un"), italic("believ"), text("able") }));
}

// ==============================================================================
// Style
// ==============================================================================

TEST_F(InlineParserTest, StyleOnEveryLeaf) {
    InlineSequence spans = inline_parse("x *y* **z**", "dark");
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(spans[0].style, "dark");
    EXPECT_EQ(spans[1].kind, SpanKind::ITALIC);
    EXPECT_EQ(spans[1].style, "dark");
    EXPECT_EQ(spans[3].kind, SpanKind::BOLD);
    ASSERT_EQ(spans[3].children.size(), 1u);
    EXPECT_EQ(spans[3].children[0].style, "dark");
}
