#include "redaction/redactor.hpp"
#include "util/logger.hpp"
#include <cctype>
#include <sstream>

namespace safeintake {
namespace redaction {

namespace {

// Next candidate of one category at or after some offset.
struct Candidate {
    bool found = false;
    bool exhausted = false;
    std::size_t start = 0;
    std::size_t end = 0;
};

// Leftmost candidate of `rule` whose span starts at or after `from`. `view` is
// the boundary view of `text` (the text itself when it has no non-ASCII
// letters). Candidates failing the leading digit guard are skipped by searching
// again one byte further on; every phone match is short, so each retry is
// bounded. A candidate covering a substituted letter is skipped past it.
Candidate searchFrom(const CategoryRule &rule, const std::string &view, const std::string &text,
                     std::size_t from)
{
    Candidate candidate;
    const re2::RE2 &re = CompiledPattern(rule.category);
    const re2::StringPiece input(view);
    re2::StringPiece groups[2];
    const int groupCount = rule.spanGroup + 1;

    std::size_t startpos = from;
    while (startpos < view.size()) {
        if (!re.Match(input, startpos, view.size(), re2::RE2::UNANCHORED, groups, groupCount)) {
            break;
        }
        const re2::StringPiece &span = groups[rule.spanGroup];
        const std::size_t start = static_cast<std::size_t>(span.data() - view.data());
        const std::size_t end = start + span.size();

        if (rule.leftDigitGuard && start > 0 &&
            std::isdigit(static_cast<unsigned char>(text[start - 1]))) {
            startpos = start + 1;
            continue;
        }

        std::size_t substituted = end;
        for (std::size_t k = end; k > start; --k) {
            if (view[k - 1] != text[k - 1]) {
                substituted = k - 1;
                break;
            }
        }
        if (substituted != end) {
            startpos = substituted + 1;
            continue;
        }

        candidate.found = true;
        candidate.start = start;
        candidate.end = end;
        break;
    }
    return candidate;
}

} // namespace

std::vector<Match> Redactor::FindMatches(const std::string &text) const
{
    std::vector<Match> selected;
    if (text.empty()) {
        return selected;
    }

    std::string boundaryView;
    const std::string &view = BuildBoundaryView(text, boundaryView) ? boundaryView : text;

    const auto &rules = CategoryRules();
    std::array<Candidate, kCategoryCount> next{};
    std::size_t cursor = 0;

    while (cursor < text.size()) {
        int best = -1;
        for (std::size_t i = 0; i < rules.size(); ++i) {
            Candidate &c = next[i];
            if (c.exhausted) {
                continue;
            }
            // A cached candidate stays the leftmost one as long as the cursor
            // has not moved past its start.
            if (!c.found || c.start < cursor) {
                c = searchFrom(rules[i], view, text, cursor);
                if (!c.found) {
                    c.exhausted = true;
                    continue;
                }
            }
            if (best < 0) {
                best = static_cast<int>(i);
                continue;
            }
            const Candidate &b = next[best];
            if (c.start < b.start ||
                (c.start == b.start && rules[i].priority < rules[best].priority)) {
                best = static_cast<int>(i);
            }
        }

        if (best < 0) {
            break;
        }

        const Candidate &chosen = next[best];
        selected.push_back(Match{chosen.start, chosen.end, rules[best].category,
                                 text.substr(chosen.start, chosen.end - chosen.start)});
        cursor = chosen.end;
    }

    return selected;
}

RedactionResult Redactor::RedactWithStats(const std::string &text) const
{
    RedactionResult result;
    result.originalLength = text.size();

    const std::vector<Match> matches = FindMatches(text);
    if (matches.empty()) {
        result.text = text;
        return result;
    }

    result.text.reserve(text.size());
    std::size_t copied = 0;
    for (const auto &m : matches) {
        result.text.append(text, copied, m.start - copied);
        ++result.detections[m.category];
        if (m_policy.ShouldMask(m.category)) {
            result.text.append(RuleFor(m.category).placeholder);
            ++result.replacements[m.category];
        } else {
            result.text.append(m.text);
        }
        copied = m.end;
    }
    result.text.append(text, copied, std::string::npos);

    if (util::logger::Logger::getInstance().getLogLevel() <= util::logger::LogLevel::DEBUG) {
        std::ostringstream oss;
        oss << "[Redactor] " << result.TotalDetections() << " span(s) detected, "
            << result.TotalReplacements() << " masked (";
        bool first = true;
        for (const auto &entry : result.detections) {
            oss << (first ? "" : ", ") << CategoryName(entry.first) << ":" << entry.second;
            first = false;
        }
        oss << ")";
        util::logger::debug(oss.str());
    }

    return result;
}

std::string Redactor::Redact(const std::string &text) const
{
    return RedactWithStats(text).text;
}

std::string redact(const std::string &text)
{
    static const Redactor defaultRedactor;
    return defaultRedactor.Redact(text);
}

} // namespace redaction
} // namespace safeintake
