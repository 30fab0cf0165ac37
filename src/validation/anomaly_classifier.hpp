#ifndef SAFEINTAKE_VALIDATION_ANOMALY_CLASSIFIER_HPP
#define SAFEINTAKE_VALIDATION_ANOMALY_CLASSIFIER_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <re2/re2.h>
#include "redaction/pii_patterns.hpp"
#include "util/text_utils.hpp"

/**
 * @file anomaly_classifier.hpp
 * @brief Structural and heuristic checks on the contact fields a submitter
 *        typed in (name, email, phone).
 *
 * Every check runs; failures are reported together, in the order email,
 * phone, name length, name denylist. Nothing here throws on bad input: an
 * unusable value is simply reported as an anomaly.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace safeintake::validation;
 *   AnomalyReport report = DetectAnomalies("Test", "test@test.com", "1111111111");
 *   // report.hasAnomaly == true, report.details.size() == 3
 *   std::string json = report.ToJson();
 *   @endcode
 */

namespace safeintake {
namespace validation {

struct AnomalyDetails
{
    std::string field;   ///< "email", "phone" or "name"
    std::string value;   ///< the raw submitted value
    std::string issue;
};

struct AnomalyReport
{
    bool hasAnomaly = false;
    std::vector<AnomalyDetails> details;

    void Add(const std::string &field, const std::string &value, const std::string &issue)
    {
        hasAnomaly = true;
        details.push_back(AnomalyDetails{field, value, issue});
    }

    /**
     * @brief {"has_anomaly":true,"anomaly_details":[{"field":..,"value":..,"issue":..}]}
     */
    std::string ToJson() const
    {
        using util::text::jsonEscape;
        std::ostringstream oss;
        oss << R"({"has_anomaly":)" << (hasAnomaly ? "true" : "false") << R"(,"anomaly_details":[)";
        for (std::size_t i = 0; i < details.size(); ++i) {
            if (i > 0) {
                oss << ",";
            }
            oss << R"({"field":")" << jsonEscape(details[i].field)
                << R"(","value":")" << jsonEscape(details[i].value)
                << R"(","issue":")" << jsonEscape(details[i].issue) << R"("})";
        }
        oss << "]}";
        return oss.str();
    }
};

constexpr const char *kEmailIssue = "Invalid or suspicious email format";
constexpr const char *kPhoneIssue = "Invalid or suspicious phone format";
constexpr const char *kNameTooShortIssue = "Name too short or empty";
constexpr const char *kSuspiciousNameIssue = "Suspicious test/dummy name detected";

inline const std::set<std::string> &PlaceholderEmails()
{
    static const std::set<std::string> emails = {
        "test@test.com", "admin@admin.com", "user@user.com",
        "example@example.com", "fake@fake.com", "dummy@dummy.com"
    };
    return emails;
}

inline const std::set<std::string> &JunkPhoneDigits()
{
    static const std::set<std::string> junk = {
        "0000000000", "1111111111", "2222222222", "3333333333",
        "4444444444", "5555555555", "6666666666", "7777777777",
        "8888888888", "9999999999", "1234567890", "0987654321"
    };
    return junk;
}

inline const std::set<std::string> &PlaceholderNames()
{
    static const std::set<std::string> names = {
        "test", "admin", "user", "dummy", "fake", "example"
    };
    return names;
}

/**
 * @brief true if every adjacent pair of digits steps by +1, or every pair by
 *        -1. Sequences shorter than 4 are never sequential.
 */
inline bool IsSequentialDigits(const std::string &digits)
{
    if (digits.size() < 4) {
        return false;
    }
    bool ascending = true;
    bool descending = true;
    for (std::size_t i = 1; i < digits.size(); ++i) {
        const int step = (digits[i] - '0') - (digits[i - 1] - '0');
        ascending = ascending && step == 1;
        descending = descending && step == -1;
    }
    return ascending || descending;
}

inline std::string ExtractDigits(const std::string &value)
{
    std::string digits;
    for (unsigned char c : value) {
        if (std::isdigit(c)) {
            digits.push_back(static_cast<char>(c));
        }
    }
    return digits;
}

inline bool IsValidEmail(const std::string &email)
{
    const re2::RE2 &shape = redaction::CompiledPattern(redaction::PatternCategory::Email);
    if (!re2::RE2::FullMatch(email, shape)) {
        return false;
    }

    const auto at = email.rfind('@');
    if (at == std::string::npos) {
        return false;
    }
    const std::string local = email.substr(0, at);
    const std::string domain = email.substr(at + 1);

    if (local.empty() || local.size() > 64) {
        return false;
    }
    if (domain.empty() || domain.size() > 255) {
        return false;
    }

    if (PlaceholderEmails().count(util::text::toLower(email)) > 0) {
        return false;
    }

    // low-entropy local part such as "aaaa" or "a.b.a.b"
    std::set<char> distinct;
    for (char c : local) {
        if (c != '.' && c != '_' && c != '-') {
            distinct.insert(c);
        }
    }
    if (distinct.size() <= 2 && local.size() > 3) {
        return false;
    }

    std::vector<std::string> labels;
    std::string label;
    std::istringstream domainStream(domain);
    while (std::getline(domainStream, label, '.')) {
        labels.push_back(label);
    }
    if (!domain.empty() && domain.back() == '.') {
        labels.push_back(std::string());
    }
    if (labels.size() < 2) {
        return false;
    }

    const std::string &tld = labels.back();
    if (tld.size() < 2) {
        return false;
    }
    return std::all_of(tld.begin(), tld.end(),
                       [](unsigned char c) { return std::isalpha(c) != 0; });
}

inline bool IsValidPhone(const std::string &phone)
{
    const std::string digits = ExtractDigits(phone);

    if (digits.size() < 7 || digits.size() > 15) {
        return false;
    }
    if (std::all_of(digits.begin(), digits.end(), [&](char c) { return c == digits.front(); })) {
        return false;
    }
    if (IsSequentialDigits(digits)) {
        return false;
    }
    return JunkPhoneDigits().count(digits) == 0;
}

inline AnomalyReport DetectAnomalies(const std::string &name,
                                     const std::string &email,
                                     const std::string &phone)
{
    AnomalyReport report;

    if (!IsValidEmail(email)) {
        report.Add("email", email, kEmailIssue);
    }
    if (!IsValidPhone(phone)) {
        report.Add("phone", phone, kPhoneIssue);
    }

    const std::string trimmedName = util::text::trim(name);
    if (trimmedName.size() < 2) {
        report.Add("name", name, kNameTooShortIssue);
    }
    if (PlaceholderNames().count(util::text::toLower(trimmedName)) > 0) {
        report.Add("name", name, kSuspiciousNameIssue);
    }

    return report;
}

} // namespace validation
} // namespace safeintake

#endif // SAFEINTAKE_VALIDATION_ANOMALY_CLASSIFIER_HPP
