#ifndef SAFEINTAKE_REDACTION_REDACTOR_HPP
#define SAFEINTAKE_REDACTION_REDACTOR_HPP

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "config/intake_config.hpp"
#include "redaction/pii_patterns.hpp"
#include "util/text_utils.hpp"

/**
 * @file redactor.hpp
 * @brief Finds PII spans in a text unit and rewrites them to placeholders.
 *
 * Candidates of all five categories are merged left to right. When several
 * categories have a candidate at the same offset the higher priority one
 * (Email > SSN > DateOfBirth > CreditCard > Phone) is selected, and scanning
 * resumes at the end of the selected span, so selected spans never overlap.
 * Each selected span is either masked with its placeholder or copied verbatim,
 * depending on the RedactionPolicy. Everything outside the spans is copied
 * byte for byte.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace safeintake::redaction;
 *   Redactor redactor;                      // default policy
 *   std::string out = redactor.Redact("Mail jane.doe@example.org");
 *   // out == "Mail [REDACTED_EMAIL]"
 *   @endcode
 */

namespace safeintake {
namespace redaction {

/**
 * @class RedactionPolicy
 * @brief Per-category choice between masking and detect-only.
 *
 * The default policy masks Email and PhoneNumber and leaves SSN, DateOfBirth
 * and CreditCardNumber detected but unmasked. Callers handling regulated data
 * should switch those three to Mask.
 */
class RedactionPolicy
{
public:
    RedactionPolicy()
    {
        for (const auto &rule : CategoryRules()) {
            m_actions[CategoryIndex(rule.category)] = rule.defaultAction;
        }
    }

    static RedactionPolicy MaskAll()
    {
        RedactionPolicy policy;
        policy.m_actions.fill(RedactionAction::Mask);
        return policy;
    }

    static RedactionPolicy FromConfig(const config::IntakeConfig &cfg)
    {
        RedactionPolicy policy;
        policy.SetAction(PatternCategory::Email, toAction(cfg.maskEmail));
        policy.SetAction(PatternCategory::SocialSecurityNumber, toAction(cfg.maskSsn));
        policy.SetAction(PatternCategory::DateOfBirth, toAction(cfg.maskDateOfBirth));
        policy.SetAction(PatternCategory::CreditCardNumber, toAction(cfg.maskCreditCard));
        policy.SetAction(PatternCategory::PhoneNumber, toAction(cfg.maskPhone));
        return policy;
    }

    void SetAction(PatternCategory category, RedactionAction action)
    {
        m_actions[CategoryIndex(category)] = action;
    }

    RedactionAction GetAction(PatternCategory category) const
    {
        return m_actions[CategoryIndex(category)];
    }

    bool ShouldMask(PatternCategory category) const
    {
        return GetAction(category) == RedactionAction::Mask;
    }

private:
    static RedactionAction toAction(bool mask)
    {
        return mask ? RedactionAction::Mask : RedactionAction::DetectOnly;
    }

    std::array<RedactionAction, kCategoryCount> m_actions;
};

/**
 * @struct Match
 * @brief One selected span: [start, end) byte offsets, its category and the
 *        exact matched text.
 */
struct Match
{
    std::size_t start;
    std::size_t end;
    PatternCategory category;
    std::string text;
};

/**
 * @struct RedactionResult
 * @brief Output of one scan, with per-category counters.
 *
 * detections counts every selected span; replacements only the masked ones.
 */
struct RedactionResult
{
    std::size_t originalLength = 0;
    std::string text;
    std::map<PatternCategory, std::size_t> replacements;
    std::map<PatternCategory, std::size_t> detections;

    std::size_t TotalReplacements() const
    {
        std::size_t total = 0;
        for (const auto &entry : replacements) {
            total += entry.second;
        }
        return total;
    }

    std::size_t TotalDetections() const
    {
        std::size_t total = 0;
        for (const auto &entry : detections) {
            total += entry.second;
        }
        return total;
    }
};

/**
 * @class Redactor
 * @brief Stateless scanner; one instance may be shared by any number of threads.
 */
class Redactor
{
public:
    Redactor() = default;
    explicit Redactor(const RedactionPolicy &policy) : m_policy(policy) {}

    /**
     * @brief Selected, non-overlapping spans in text order.
     */
    std::vector<Match> FindMatches(const std::string &text) const;

    RedactionResult RedactWithStats(const std::string &text) const;

    std::string Redact(const std::string &text) const;

    /**
     * @brief Coerce any printable value to text, then redact it.
     */
    template <typename T>
    std::string RedactValue(const T &value) const
    {
        return Redact(util::text::toText(value));
    }

    const RedactionPolicy &Policy() const { return m_policy; }

private:
    RedactionPolicy m_policy;
};

/**
 * @brief Redact with the default policy.
 */
std::string redact(const std::string &text);

} // namespace redaction
} // namespace safeintake

#endif // SAFEINTAKE_REDACTION_REDACTOR_HPP
