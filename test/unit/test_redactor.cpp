// Redactor: merge order, placeholders, policy and verbatim copying.

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "redaction/redactor.hpp"

namespace {

using safeintake::redaction::Match;
using safeintake::redaction::PatternCategory;
using safeintake::redaction::RedactionAction;
using safeintake::redaction::RedactionPolicy;
using safeintake::redaction::Redactor;
using safeintake::redaction::redact;

TEST(RedactorTest, EmptyInputGivesEmptyOutput) {
    EXPECT_EQ(redact(""), "");
    EXPECT_TRUE(Redactor().FindMatches("").empty());
}

TEST(RedactorTest, TextWithoutPiiIsUnchanged) {
    const std::string text = "Order #42 shipped on Tuesday, 3 boxes.\nThanks!";
    EXPECT_EQ(redact(text), text);
}

TEST(RedactorTest, EmailAndPhoneAreMasked) {
    EXPECT_EQ(redact("Contact jane.doe@example.org or 555-123-4567"),
              "Contact [REDACTED_EMAIL] or [REDACTED_PHONE]");
}

TEST(RedactorTest, SixDigitsAreNotAPhoneSevenAre) {
    EXPECT_EQ(redact("code 123456 end"), "code 123456 end");
    EXPECT_EQ(redact("code 1234567 end"), "code [REDACTED_PHONE] end");
}

// A run too long to be a phone must not be cut into a shorter phone that
// starts or ends next to another digit.
TEST(RedactorTest, PhoneNeedsNonDigitNeighbours) {
    const std::string run = "id 123456789012345678901234 end";
    EXPECT_EQ(redact(run), run);
}

TEST(RedactorTest, SsnWinsOverPhoneAndIsKeptByDefault) {
    Redactor redactor;
    const std::string text = "SSN 123-45-6789";
    std::vector<Match> matches = redactor.FindMatches(text);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].category, PatternCategory::SocialSecurityNumber);
    EXPECT_EQ(matches[0].start, 4u);
    EXPECT_EQ(matches[0].end, text.size());
    EXPECT_EQ(matches[0].text, "123-45-6789");

    EXPECT_EQ(redactor.Redact(text), text);
}

TEST(RedactorTest, DateWinsOverPhone) {
    Redactor redactor;
    std::vector<Match> matches = redactor.FindMatches("born 1990-05-17");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].category, PatternCategory::DateOfBirth);
    EXPECT_EQ(redactor.Redact("born 1990-05-17"), "born 1990-05-17");
}

TEST(RedactorTest, InvalidDateFallsThroughToPhone) {
    EXPECT_EQ(redact("born 1990-13-01"), "born [REDACTED_PHONE]");
}

TEST(RedactorTest, CardIsDetectedButKeptByDefault) {
    Redactor redactor;
    const std::string text = "card 4111 1111 1111 1111 exp";
    auto result = redactor.RedactWithStats(text);
    EXPECT_EQ(result.text, text);
    EXPECT_EQ(result.detections[PatternCategory::CreditCardNumber], 1u);
    EXPECT_EQ(result.TotalReplacements(), 0u);
}

TEST(RedactorTest, MaskAllPolicyUsesCategoryPlaceholders) {
    Redactor redactor(RedactionPolicy::MaskAll());
    EXPECT_EQ(redactor.Redact("SSN 123-45-6789"), "SSN [REDACTED_SSN]");
    EXPECT_EQ(redactor.Redact("DOB 05/17/1990"), "DOB [REDACTED_DOB]");
    EXPECT_EQ(redactor.Redact("card 4111-1111-1111-1111"), "card [REDACTED_CREDIT_CARD]");
}

TEST(RedactorTest, PolicyCanKeepEmailsVisible) {
    RedactionPolicy policy;
    policy.SetAction(PatternCategory::Email, RedactionAction::DetectOnly);
    EXPECT_FALSE(policy.ShouldMask(PatternCategory::Email));
    EXPECT_TRUE(policy.ShouldMask(PatternCategory::PhoneNumber));

    Redactor redactor(policy);
    EXPECT_EQ(redactor.Redact("jane.doe@example.org 415-555-2671"),
              "jane.doe@example.org [REDACTED_PHONE]");
}

TEST(RedactorTest, PolicyFromConfig) {
    safeintake::config::IntakeConfig cfg;
    cfg.maskSsn = true;
    cfg.maskPhone = false;
    RedactionPolicy policy = RedactionPolicy::FromConfig(cfg);
    EXPECT_TRUE(policy.ShouldMask(PatternCategory::Email));
    EXPECT_TRUE(policy.ShouldMask(PatternCategory::SocialSecurityNumber));
    EXPECT_FALSE(policy.ShouldMask(PatternCategory::PhoneNumber));
    EXPECT_FALSE(policy.ShouldMask(PatternCategory::DateOfBirth));
}

TEST(RedactorTest, MatchesAreOrderedAndDisjoint) {
    Redactor redactor;
    const std::string text = "a@example.com, 415-555-2671; 123-45-6789 and b.c@example.net";
    std::vector<Match> matches = redactor.FindMatches(text);
    ASSERT_EQ(matches.size(), 4u);
    EXPECT_EQ(matches[0].category, PatternCategory::Email);
    EXPECT_EQ(matches[1].category, PatternCategory::PhoneNumber);
    EXPECT_EQ(matches[2].category, PatternCategory::SocialSecurityNumber);
    EXPECT_EQ(matches[3].category, PatternCategory::Email);
    for (std::size_t i = 0; i < matches.size(); ++i) {
        EXPECT_LT(matches[i].start, matches[i].end);
        EXPECT_EQ(text.substr(matches[i].start, matches[i].end - matches[i].start), matches[i].text);
        if (i > 0) {
            EXPECT_LE(matches[i - 1].end, matches[i].start);
        }
    }
}

TEST(RedactorTest, TextOutsideSpansIsCopiedVerbatim) {
    Redactor redactor(RedactionPolicy::MaskAll());
    const std::string text = "Café \xE2\x98\x8E jane.doe@example.org\t(415) 555-2671!\r\n";
    EXPECT_EQ(redactor.Redact(text), "Café \xE2\x98\x8E [REDACTED_EMAIL]\t[REDACTED_PHONE]!\r\n");
}

TEST(RedactorTest, RedactingTwiceChangesNothing) {
    const std::string inputs[] = {
        "Contact jane.doe@example.org or 555-123-4567",
        "SSN 123-45-6789, born 1990-13-01, card 4111111111111111",
        "+1 (415) 555-2671 / x@y.io",
    };
    for (const auto& text : inputs) {
        const std::string once = redact(text);
        EXPECT_EQ(redact(once), once);
    }
    Redactor strict(RedactionPolicy::MaskAll());
    for (const auto& text : inputs) {
        const std::string once = strict.Redact(text);
        EXPECT_EQ(strict.Redact(once), once);
    }
}

// An email glued to a phone number has no boundary after its TLD. Masking the
// phone creates one, so a second pass finds the email.
TEST(RedactorTest, EmailGluedToPhoneNeedsSecondPass) {
    const std::string once = redact("a@b.com5551234567");
    EXPECT_EQ(once, "a@b.com[REDACTED_PHONE]");
    EXPECT_EQ(redact(once), "[REDACTED_EMAIL][REDACTED_PHONE]");
}

TEST(RedactorTest, NonAsciiLettersAreWordCharacters) {
    // card number glued to CJK text: no boundary, so only the phone rule fits
    const std::string card = "\xE5\x8D\xA1\xE5\x8F\xB7" "4111111111111111";
    EXPECT_EQ(redact(card), "\xE5\x8D\xA1\xE5\x8F\xB7" "[REDACTED_PHONE]");
    std::vector<Match> matches = Redactor().FindMatches(card);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].category, PatternCategory::PhoneNumber);
    EXPECT_EQ(matches[0].start, 6u);

    const std::string gluedEmail = "\xE8\x81\x94\xE7\xB3\xBB" "jane.doe@example.org" "\xE8\xB0\xA2";
    EXPECT_EQ(redact(gluedEmail), gluedEmail);
    EXPECT_EQ(redact("\xE8\x81\x94 jane.doe@example.org \xE8\xB0\xA2"),
              "\xE8\x81\x94 [REDACTED_EMAIL] \xE8\xB0\xA2");

    Redactor strict(RedactionPolicy::MaskAll());
    EXPECT_EQ(strict.Redact("\xC3\xA9" "123-45-6789"), "\xC3\xA9" "[REDACTED_PHONE]");
    EXPECT_EQ(strict.Redact("\xC3\xA9 123-45-6789"), "\xC3\xA9 [REDACTED_SSN]");
}

TEST(RedactorTest, EmailLocalPartNeverTakesNonAsciiLetters) {
    const std::string underscore = "\xC3\xA9" "_jane@x.com";
    EXPECT_EQ(redact(underscore), underscore);
    EXPECT_EQ(redact("\xE5\x90\x8D" "a.jane@x.com"), "\xE5\x90\x8D" "a[REDACTED_EMAIL]");
}

TEST(RedactorTest, NonLetterSymbolsStillBoundWords) {
    EXPECT_EQ(redact("\xE2\x98\x8E" "415-555-2671" "\xE3\x80\x82"),
              "\xE2\x98\x8E" "[REDACTED_PHONE]" "\xE3\x80\x82");
    Redactor strict(RedactionPolicy::MaskAll());
    EXPECT_EQ(strict.Redact("\xE3\x80\x8C" "123-45-6789" "\xE3\x80\x8D"),
              "\xE3\x80\x8C" "[REDACTED_SSN]" "\xE3\x80\x8D");
}

TEST(RedactorTest, StatsCountDetectionsAndReplacements) {
    Redactor redactor;
    auto result = redactor.RedactWithStats("a@b.co, 415-555-2671, c@d.io, SSN 123-45-6789");
    EXPECT_EQ(result.originalLength, std::string("a@b.co, 415-555-2671, c@d.io, SSN 123-45-6789").size());
    EXPECT_EQ(result.replacements[PatternCategory::Email], 2u);
    EXPECT_EQ(result.replacements[PatternCategory::PhoneNumber], 1u);
    EXPECT_EQ(result.replacements.count(PatternCategory::SocialSecurityNumber), 0u);
    EXPECT_EQ(result.detections[PatternCategory::SocialSecurityNumber], 1u);
    EXPECT_EQ(result.TotalDetections(), 4u);
    EXPECT_EQ(result.TotalReplacements(), 3u);
}

TEST(RedactorTest, NonStringValuesAreCoercedFirst) {
    Redactor redactor;
    EXPECT_EQ(redactor.RedactValue(42), "42");
    EXPECT_EQ(redactor.RedactValue(4155552671LL), "[REDACTED_PHONE]");
    EXPECT_EQ(redactor.RedactValue(true), "True");
    EXPECT_EQ(redactor.RedactValue(std::string("x@example.com")), "[REDACTED_EMAIL]");
}

} // namespace
