#include <gtest/gtest.h>
#include "../include/errors.hpp"
#include "../include/text_cleaner.hpp"

using namespace tokbench;

namespace {

std::string clean_ur(const std::string& text) { return TextCleaner(Language::Urdu).clean_text(text); }
std::string clean_zh(const std::string& text) { return TextCleaner(Language::Chinese).clean_text(text); }
std::string clean_hi(const std::string& text) { return TextCleaner(Language::Hindi).clean_text(text); }

} // namespace

TEST(TextCleanerTest, KeepsPlainUrduSentence) {
    EXPECT_EQ(clean_ur("یہ ایک جملہ ہے"), "یہ ایک جملہ ہے");
}

TEST(TextCleanerTest, MapsArabicLetterVariantsToUrduForms) {
    // kaf and yeh from the Arabic block
    EXPECT_EQ(clean_ur("\xD9\x83\xD8\xAA\xD8\xA7\xD8\xA8"), "\xDA\xA9\xD8\xAA\xD8\xA7\xD8\xA8");
    EXPECT_EQ(clean_ur("\xD9\x8A"), "\xDB\x8C");
}

TEST(TextCleanerTest, DropsUrduDiacriticsAndDigits) {
    // beh + fatha
    EXPECT_EQ(clean_ur("\xD8\xA8\xD9\x8E"), "\xD8\xA8");
    EXPECT_EQ(clean_ur("یہ ۱۲۳ ہے 42"), "یہ ہے");
}

TEST(TextCleanerTest, UrduPunctuationBecomesSpace) {
    EXPECT_EQ(clean_ur("یہ۔وہ"), "یہ وہ");
    EXPECT_EQ(clean_ur("کیا؟ہاں،ٹھیک"), "کیا ہاں ٹھیک");
}

TEST(TextCleanerTest, DropsLatinFromUrdu) {
    EXPECT_EQ(clean_ur("abc یہ"), "یہ");
}

TEST(TextCleanerTest, CollapsesAndTrimsWhiteSpace) {
    EXPECT_EQ(clean_ur("  یہ \t\t  ہے  "), "یہ ہے");
}

TEST(TextCleanerTest, ChineseNumeralsAndPunctuationBecomeSpace) {
    EXPECT_EQ(clean_zh("我有三本书。"), "我有 本书");
    EXPECT_EQ(clean_zh("hello世界"), "世界");
}

TEST(TextCleanerTest, HindiDandaAndDigits) {
    EXPECT_EQ(clean_hi("यह एक वाक्य है।"), "यह एक वाक्य है");
    EXPECT_EQ(clean_hi("१२३ किताब 45"), "किताब");
}

TEST(TextCleanerTest, EmptyResultMarksSentenceDegenerate) {
    Sentence sentence{"123 !!! 456", Language::Urdu, 7};
    CleanedSentence cleaned = TextCleaner(Language::Urdu).clean(sentence);
    EXPECT_TRUE(cleaned.text.empty());
    EXPECT_TRUE(cleaned.degenerate);
    EXPECT_EQ(cleaned.offset, 7u);
}

TEST(TextCleanerTest, IllFormedUtf8Throws) {
    EXPECT_THROW(clean_ur(std::string("\xFF\xFE abc")), CleaningError);
    EXPECT_THROW(clean_hi(std::string("\xE0\xA4")), CleaningError);
}

TEST(TextCleanerTest, IsDeterministic) {
    const std::string text = "یہ ایک، بہت اچھی کتاب ہے۔ 2024";
    TextCleaner cleaner(Language::Urdu);
    EXPECT_EQ(cleaner.clean_text(text), cleaner.clean_text(text));
    EXPECT_EQ(cleaner.clean_text(text), TextCleaner(Language::Urdu).clean_text(text));
}

TEST(TextCleanerTest, CustomRuleTable) {
    CleaningRuleTable table;
    table.rules.push_back({U'0', U'9', CleanAction::Replace, U'#'});
    table.rules.push_back({U'a', U'z', CleanAction::Keep});
    table.default_action = CleanAction::Drop;
    TextCleaner cleaner(Language::Urdu, table);
    EXPECT_EQ(cleaner.clean_text("abc12 XYZ de"), "abc## de");
}

TEST(TextCleanerTest, FirstMatchingRuleWins) {
    CleaningRuleTable table;
    table.rules.push_back({U'b', U'b', CleanAction::Drop});
    table.rules.push_back({U'a', U'z', CleanAction::Keep});
    table.default_action = CleanAction::Space;
    EXPECT_EQ(TextCleaner(Language::Urdu, table).clean_text("abc"), "ac");
}

TEST(TextCleanerTest, FreeFunctionUsesDefaultTable) {
    Sentence sentence{"یہ۔", Language::Urdu, 3};
    CleanedSentence cleaned = clean(sentence, Language::Urdu);
    EXPECT_EQ(cleaned.text, "یہ");
    EXPECT_FALSE(cleaned.degenerate);
}

TEST(TextCleanerTest, ParsesActionNames) {
    EXPECT_EQ(parse_clean_action("keep"), CleanAction::Keep);
    EXPECT_EQ(parse_clean_action("DROP"), CleanAction::Drop);
    EXPECT_EQ(parse_clean_action("Space"), CleanAction::Space);
    EXPECT_EQ(parse_clean_action("replace"), CleanAction::Replace);
    EXPECT_THROW(parse_clean_action("remove"), ConfigError);
}
