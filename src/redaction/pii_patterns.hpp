#ifndef SAFEINTAKE_REDACTION_PII_PATTERNS_HPP
#define SAFEINTAKE_REDACTION_PII_PATTERNS_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <re2/re2.h>

/**
 * @file pii_patterns.hpp
 * @brief The fixed table of PII categories: pattern, priority, placeholder and
 *        default action, plus the process-wide compiled RE2 programs.
 *
 * NOTES:
 *   - Table order is priority order (Email first, PhoneNumber last). The
 *     redactor resolves candidates that start at the same offset by priority.
 *   - All patterns are compiled in Latin-1 mode so offsets are byte offsets and
 *     arbitrary (even invalid UTF-8) input is accepted. Every pattern only
 *     consumes ASCII, so a span never splits a multi-byte character.
 *   - RE2's \b only knows ASCII word characters. Patterns therefore run over a
 *     boundary view of the text (BuildBoundaryView) in which each byte of a
 *     non-ASCII letter or number reads as '_', so digits glued to an accented
 *     or CJK letter have no boundary before them. Only the email local part accepts '_';
 *     the redactor drops candidates that cover a substituted byte.
 *   - RE2 has no look-around. The phone rule's trailing "no digit follows"
 *     guard is a trailing (?:\D|$) outside the reported span (group 1); the
 *     leading "no digit precedes" guard is checked by the redactor
 *     (leftDigitGuard).
 *   - Placeholders contain no digits and no '@', so redacted output never
 *     matches again.
 */

namespace safeintake {
namespace redaction {

enum class PatternCategory {
    Email = 0,
    SocialSecurityNumber,
    DateOfBirth,
    CreditCardNumber,
    PhoneNumber
};

constexpr std::size_t kCategoryCount = 5;

enum class RedactionAction {
    Mask,
    DetectOnly
};

struct CategoryRule
{
    PatternCategory category;
    int priority;               ///< lower value wins when two candidates start together
    const char *name;
    const char *pattern;
    int spanGroup;              ///< capture group holding the reported span (0 = whole match)
    bool leftDigitGuard;        ///< reject a candidate whose preceding byte is a digit
    const char *placeholder;
    RedactionAction defaultAction;
};

/**
 * @brief The five categories in priority order.
 */
inline const std::array<CategoryRule, kCategoryCount> &CategoryRules()
{
    static const std::array<CategoryRule, kCategoryCount> rules = {{
        {PatternCategory::Email, 0, "EMAIL",
         R"(\b[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}\b)",
         0, false, "[REDACTED_EMAIL]", RedactionAction::Mask},

        {PatternCategory::SocialSecurityNumber, 1, "SSN",
         R"(\b\d{3}-\d{2}-\d{4}\b)",
         0, false, "[REDACTED_SSN]", RedactionAction::DetectOnly},

        {PatternCategory::DateOfBirth, 2, "DATE_OF_BIRTH",
         R"(\b(?:)"
         R"((?:19|20)\d{2}-(?:0[1-9]|1[0-2])-(?:0[1-9]|[12]\d|3[01]))"
         R"(|(?:0[1-9]|1[0-2])-(?:0[1-9]|[12]\d|3[01])-(?:19|20)\d{2})"
         R"(|(?:0[1-9]|[12]\d|3[01])-(?:0[1-9]|1[0-2])-(?:19|20)\d{2})"
         R"(|(?:0[1-9]|1[0-2])/(?:0[1-9]|[12]\d|3[01])/(?:19|20)\d{2})"
         R"(|(?:0[1-9]|[12]\d|3[01])/(?:0[1-9]|1[0-2])/(?:19|20)\d{2})"
         R"()\b)",
         0, false, "[REDACTED_DOB]", RedactionAction::DetectOnly},

        {PatternCategory::CreditCardNumber, 3, "CREDIT_CARD",
         R"(\b\d(?:[ -]?\d){12,18}\b)",
         0, false, "[REDACTED_CREDIT_CARD]", RedactionAction::DetectOnly},

        {PatternCategory::PhoneNumber, 4, "PHONE",
         R"(((?:\+?\d{1,3}[\s\-.]?)?(?:\(?\d{2,4}\)?[\s\-.]?)?(?:\d[\s\-.]?){6,14}\d)(?:\D|$))",
         1, true, "[REDACTED_PHONE]", RedactionAction::Mask},
    }};
    return rules;
}

inline std::size_t CategoryIndex(PatternCategory category)
{
    return static_cast<std::size_t>(category);
}

inline const CategoryRule &RuleFor(PatternCategory category)
{
    return CategoryRules()[CategoryIndex(category)];
}

inline std::string CategoryName(PatternCategory category)
{
    return RuleFor(category).name;
}

/**
 * @brief Length of the well-formed UTF-8 sequence starting at text[pos], or 0
 *        if the bytes there are not one.
 */
inline std::size_t Utf8SequenceLength(const std::string &text, std::size_t pos)
{
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
    } else {
        return 0;
    }
    if (pos + len > text.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if (c < 0x80 || c > 0xBF) {
            return 0;
        }
    }
    return len;
}

/**
 * @brief Build the view of `text` the patterns search: same length, every byte
 *        of a non-ASCII letter or number (Unicode L or N) replaced by '_'.
 *        Malformed UTF-8 and other non-ASCII characters are left as they are.
 * @return false if nothing needed replacing; `view` is untouched then and the
 *         text itself can be searched.
 */
inline bool BuildBoundaryView(const std::string &text, std::string &view)
{
    static const re2::RE2 letterOrNumber(R"([\p{L}\p{N}])");

    bool replaced = false;
    std::size_t i = 0;
    while (i < text.size()) {
        if (static_cast<unsigned char>(text[i]) < 0x80) {
            ++i;
            continue;
        }
        const std::size_t len = Utf8SequenceLength(text, i);
        if (len == 0) {
            ++i;
            continue;
        }
        if (re2::RE2::FullMatch(re2::StringPiece(text.data() + i, len), letterOrNumber)) {
            if (!replaced) {
                view = text;
                replaced = true;
            }
            view.replace(i, len, len, '_');
        }
        i += len;
    }
    return replaced;
}

/**
 * @brief Compiled program for a category. Built once on first use; immutable
 *        and safe to share between threads afterwards.
 * @throw std::runtime_error if a pattern in the table does not compile.
 */
inline const re2::RE2 &CompiledPattern(PatternCategory category)
{
    using Programs = std::array<std::unique_ptr<re2::RE2>, kCategoryCount>;
    static const Programs programs = [] {
        Programs compiled;
        re2::RE2::Options options;
        options.set_encoding(re2::RE2::Options::EncodingLatin1);
        options.set_log_errors(false);
        for (const auto &rule : CategoryRules()) {
            auto re = std::make_unique<re2::RE2>(rule.pattern, options);
            if (!re->ok()) {
                throw std::runtime_error(std::string("PiiPatterns: pattern for ") + rule.name +
                                         " failed to compile: " + re->error());
            }
            compiled[CategoryIndex(rule.category)] = std::move(re);
        }
        return compiled;
    }();
    return *programs[CategoryIndex(category)];
}

} // namespace redaction
} // namespace safeintake

#endif // SAFEINTAKE_REDACTION_PII_PATTERNS_HPP
