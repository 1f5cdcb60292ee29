#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "redaction/tacet_category_matcher.h"

using Tacet::BuiltinCategory;
using Tacet::CategoryMatcher;
using Tacet::Span;

namespace {

std::vector<std::string> Texts(const std::vector<Span>& spans) {
  std::vector<std::string> texts;
  for (const auto& span : spans) {
    texts.push_back(span.matched_text);
  }
  return texts;
}

// ------------------------------------------------------------
// Names
// ------------------------------------------------------------

TEST(NameMatcherTest, TwoCapitalizedTokens) {
  std::string text = "Contact John Smith at john.smith@email.com or call 555-123-4567.";
  std::vector<Span> spans = CategoryMatcher::MatchNames(text);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].matched_text, "John Smith");
  EXPECT_EQ(spans[0].start, text.find("John"));
  EXPECT_EQ(spans[0].end, text.find(" at"));
  EXPECT_EQ(spans[0].source, "names");
  EXPECT_FALSE(spans[0].category.is_custom);
}

TEST(NameMatcherTest, HonorificSuffixAndInitials) {
  EXPECT_EQ(Texts(CategoryMatcher::MatchNames("Call Dr. Sarah Connor tomorrow")),
            std::vector<std::string>({"Dr. Sarah Connor"}));
  EXPECT_EQ(Texts(CategoryMatcher::MatchNames("Mixed by Robert Johnson Jr. last week")),
            std::vector<std::string>({"Robert Johnson Jr."}));
  EXPECT_EQ(Texts(CategoryMatcher::MatchNames("Signed by John Smith, Jr. today")),
            std::vector<std::string>({"John Smith, Jr."}));
  EXPECT_EQ(Texts(CategoryMatcher::MatchNames("Vocals by Mary A. Brown on track two")),
            std::vector<std::string>({"Mary A. Brown"}));
}

TEST(NameMatcherTest, TrailingInitialIsNotPartOfTheName) {
  EXPECT_EQ(Texts(CategoryMatcher::MatchNames("Thanks John Smith B. for the mix")),
            std::vector<std::string>({"John Smith"}));
}

TEST(NameMatcherTest, SingleWordsAndStopWordsAreIgnored) {
  EXPECT_TRUE(CategoryMatcher::MatchNames("Used Neumann U87 microphone on vocals.").empty());
  EXPECT_TRUE(CategoryMatcher::MatchNames("Recorded at Abbey Road Studios on Monday.").empty());
  EXPECT_TRUE(CategoryMatcher::MatchNames("Used Universal Audio converters.").empty());
  EXPECT_TRUE(CategoryMatcher::MatchNames("Session Notes: Vocal Chain Setup").empty());
}

TEST(NameMatcherTest, SentenceBoundaryBreaksTheRun) {
  EXPECT_EQ(Texts(CategoryMatcher::MatchNames("Met Sarah. John Smith arrived later.")),
            std::vector<std::string>({"John Smith"}));
}

TEST(NameMatcherTest, NewlineBreaksTheRun) {
  EXPECT_TRUE(CategoryMatcher::MatchNames("Producer: John\nSmith was late").empty());
}

TEST(NameMatcherTest, StopWordListIsCaseInsensitive) {
  EXPECT_TRUE(CategoryMatcher::IsNameStopWord("Studio"));
  EXPECT_TRUE(CategoryMatcher::IsNameStopWord("STREET"));
  EXPECT_FALSE(CategoryMatcher::IsNameStopWord("Smith"));
}

// ------------------------------------------------------------
// Emails
// ------------------------------------------------------------

TEST(EmailMatcherTest, FindsEmailsAndStopsBeforeSentencePunctuation) {
  std::vector<Span> spans =
    CategoryMatcher::MatchEmails("Mail john.smith@email.com. Or sarah+mix@studio.co.uk today");
  EXPECT_EQ(Texts(spans), std::vector<std::string>({"john.smith@email.com", "sarah+mix@studio.co.uk"}));
}

TEST(EmailMatcherTest, RejectsMalformedDomains) {
  EXPECT_TRUE(CategoryMatcher::MatchEmails("send to user@-bad.com please").empty());
  EXPECT_TRUE(CategoryMatcher::MatchEmails("send to admin@localhost please").empty());
  EXPECT_TRUE(CategoryMatcher::MatchEmails("version 1.2@3.4 build").empty());
}

TEST(EmailMatcherTest, Validation) {
  EXPECT_TRUE(CategoryMatcher::IsValidEmail("john.smith@email.com"));
  EXPECT_TRUE(CategoryMatcher::IsValidEmail("a_b-c@sub.domain.io"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail(".john@email.com"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail("john.@email.com"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail("jo..hn@email.com"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail("john@email.c"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail("john@email.c0m"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail("john@email-.com"));
  EXPECT_FALSE(CategoryMatcher::IsValidEmail(std::string(65, 'a') + "@email.com"));
}

TEST(EmailMatcherTest, LocalPartStartsAfterInvalidPrefix) {
  EXPECT_EQ(Texts(CategoryMatcher::MatchEmails("see x..john@mail.com now")),
            std::vector<std::string>({"john@mail.com"}));
  EXPECT_EQ(Texts(CategoryMatcher::MatchEmails("a@b.com,c@d.org")),
            std::vector<std::string>({"a@b.com", "c@d.org"}));
  EXPECT_TRUE(CategoryMatcher::MatchEmails("x@y@-bad.com").empty());
}

TEST(EmailMatcherTest, OverlongLocalRunKeepsLastSixtyFourCharacters) {
  std::string run(19000, 'a');
  std::vector<Span> spans = CategoryMatcher::MatchEmails(run + "@mail.com here");
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].start, 19000u - 64u);
  EXPECT_EQ(spans[0].matched_text, std::string(64, 'a') + "@mail.com");

  EXPECT_TRUE(CategoryMatcher::MatchEmails(run + " no address here").empty());
  EXPECT_TRUE(CategoryMatcher::MatchEmails("a@" + run + " unterminated").empty());
}

// ------------------------------------------------------------
// Phones
// ------------------------------------------------------------

TEST(PhoneMatcherTest, SeparatorVariants) {
  std::string text = "Office (555) 123-4567, toll free 1-800-555-0123, cell 555.555.9999, "
                     "intl +1 555 321 7654, raw 5551234567.";
  EXPECT_EQ(Texts(CategoryMatcher::MatchPhones(text)),
            std::vector<std::string>({"(555) 123-4567", "1-800-555-0123", "555.555.9999",
                                      "+1 555 321 7654", "5551234567"}));
}

TEST(PhoneMatcherTest, RejectsDigitsEmbeddedInLongerRuns) {
  EXPECT_TRUE(CategoryMatcher::MatchPhones("Order 12345678901234 shipped").empty());
  EXPECT_TRUE(CategoryMatcher::MatchPhones("Card 4532-1234-5678-9012 on file").empty());
  EXPECT_TRUE(CategoryMatcher::MatchPhones("Serial AB5551234567 noted").empty());
}

// ------------------------------------------------------------
// Addresses
// ------------------------------------------------------------

TEST(AddressMatcherTest, FullAddressWithCityStateZip) {
  std::vector<Span> spans =
    CategoryMatcher::MatchAddresses("Ship to 123 Main Street, Los Angeles, CA 90028 by Friday");
  EXPECT_EQ(Texts(spans), std::vector<std::string>({"123 Main Street, Los Angeles, CA 90028"}));
}

TEST(AddressMatcherTest, UnitAndOrdinalStreets) {
  EXPECT_EQ(Texts(CategoryMatcher::MatchAddresses("Studio at 456 Oak Avenue Suite 200 upstairs")),
            std::vector<std::string>({"456 Oak Avenue Suite 200"}));
  EXPECT_EQ(Texts(CategoryMatcher::MatchAddresses("Meet at 77 West 5th Street tonight")),
            std::vector<std::string>({"77 West 5th Street"}));
}

TEST(AddressMatcherTest, NumbersWithoutStreetTypeAreIgnored) {
  EXPECT_TRUE(CategoryMatcher::MatchAddresses("Recorded 12 Songs with the Neve 1073").empty());
}

// ------------------------------------------------------------
// Financial
// ------------------------------------------------------------

TEST(FinancialMatcherTest, GroupedCardsAccountsAndRouting) {
  std::string text = "Card 4532-1234-5678-9012, account 987654321, routing 123456789.";
  EXPECT_EQ(Texts(CategoryMatcher::MatchFinancial(text)),
            std::vector<std::string>({"4532-1234-5678-9012", "987654321", "123456789"}));
}

TEST(FinancialMatcherTest, ContiguousCardNeedsLuhn) {
  EXPECT_EQ(Texts(CategoryMatcher::MatchFinancial("Paid with 4111111111111111 today")),
            std::vector<std::string>({"4111111111111111"}));
  // 18 digits, not Luhn-valid, too long for an account number
  EXPECT_TRUE(CategoryMatcher::MatchFinancial("Ref 123456789012345678 logged").empty());
}

TEST(FinancialMatcherTest, ShortAndOverlongRunsAreIgnored) {
  EXPECT_TRUE(CategoryMatcher::MatchFinancial("Take 1234567 was the keeper").empty());
  EXPECT_TRUE(CategoryMatcher::MatchFinancial("Hash 12345678901234567890 stored").empty());
}

TEST(FinancialMatcherTest, Luhn) {
  EXPECT_TRUE(CategoryMatcher::IsValidCreditCard("4111111111111111"));
  EXPECT_TRUE(CategoryMatcher::IsValidCreditCard("4532015112830366"));
  EXPECT_FALSE(CategoryMatcher::IsValidCreditCard("4532123456789012"));
  EXPECT_FALSE(CategoryMatcher::IsValidCreditCard("411111111111"));   // too short
  EXPECT_FALSE(CategoryMatcher::IsValidCreditCard("4111-1111-1111-1111"));
}

// ------------------------------------------------------------
// Candidate collection
// ------------------------------------------------------------

TEST(CategoryMatcherTest, FindCandidatesOnlyRunsRequestedCategories) {
  std::string text = "Contact John Smith at john.smith@email.com or call 555-123-4567.";

  std::vector<Span> emails_only = CategoryMatcher::FindCandidates(text, {BuiltinCategory::EMAILS});
  EXPECT_EQ(Texts(emails_only), std::vector<std::string>({"john.smith@email.com"}));

  std::vector<Span> all = CategoryMatcher::FindCandidates(
    text, {BuiltinCategory::PHONES, BuiltinCategory::NAMES, BuiltinCategory::EMAILS,
           BuiltinCategory::NAMES});
  EXPECT_EQ(Texts(all),
            std::vector<std::string>({"John Smith", "john.smith@email.com", "555-123-4567"}));
  for (size_t i = 1; i < all.size(); ++i) {
    EXPECT_LE(all[i - 1].start, all[i].start);
  }

  EXPECT_TRUE(CategoryMatcher::FindCandidates(text, {}).empty());
}

TEST(CategoryMatcherTest, SelectLeftmostLongest) {
  Span a;
  a.start = 0;
  a.end = 5;
  Span b;
  b.start = 0;
  b.end = 8;
  Span c;
  c.start = 6;
  c.end = 10;
  Span d;
  d.start = 9;
  d.end = 12;

  std::vector<Span> selected = CategoryMatcher::SelectLeftmostLongest({a, c, b, d});
  ASSERT_EQ(selected.size(), 2u);
  EXPECT_EQ(selected[0].end, 8u);
  EXPECT_EQ(selected[1].start, 9u);
}

// ------------------------------------------------------------
// Category and mode names
// ------------------------------------------------------------

TEST(CategoryNamesTest, ModeNamesParseBack) {
  const Tacet::RedactionMode modes[] = {
    Tacet::RedactionMode::REPLACE, Tacet::RedactionMode::MASK,
    Tacet::RedactionMode::HASH, Tacet::RedactionMode::REMOVE,
  };
  for (Tacet::RedactionMode mode : modes) {
    Tacet::RedactionMode parsed = Tacet::RedactionMode::REPLACE;
    ASSERT_TRUE(Tacet::ParseRedactionMode(Tacet::RedactionModeName(mode), &parsed));
    EXPECT_EQ(parsed, mode);
  }
  EXPECT_STREQ(Tacet::RedactionModeName(Tacet::RedactionMode::REMOVE), "remove");
}

}  // namespace
