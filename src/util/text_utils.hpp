#ifndef SAFEINTAKE_UTIL_TEXT_UTILS_HPP
#define SAFEINTAKE_UTIL_TEXT_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

/**
 * @file text_utils.hpp
 * @brief Small string helpers shared by the redaction, validation and
 *        ingestion code: trimming, ASCII case folding, lossy UTF-8 decoding,
 *        JSON string escaping and value-to-text coercion.
 */

namespace safeintake {
namespace util {
namespace text {

inline std::string trim(const std::string &s)
{
    static const char *whitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

inline std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool endsWithIgnoreCase(const std::string &s, const std::string &suffix)
{
    if (suffix.size() > s.size()) {
        return false;
    }
    return toLower(s.substr(s.size() - suffix.size())) == toLower(suffix);
}

/**
 * @brief Decode bytes as UTF-8, dropping every byte that is not part of a
 *        well-formed sequence (overlongs, surrogates and truncated sequences
 *        included).
 */
inline std::string decodeUtf8Lossy(const std::vector<uint8_t> &bytes)
{
    std::string out;
    out.reserve(bytes.size());
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        const uint8_t b0 = bytes[i];
        if (b0 < 0x80) {
            out.push_back(static_cast<char>(b0));
            ++i;
            continue;
        }

        std::size_t len = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2;
        } else if (b0 >= 0xE0 && b0 <= 0xEF) {
            len = 3;
            if (b0 == 0xE0) lo = 0xA0;
            if (b0 == 0xED) hi = 0x9F;
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4;
            if (b0 == 0xF0) lo = 0x90;
            if (b0 == 0xF4) hi = 0x8F;
        } else {
            ++i;
            continue;
        }

        std::size_t consumed = 1;
        bool valid = true;
        for (; consumed < len; ++consumed) {
            if (i + consumed >= n) {
                valid = false;
                break;
            }
            const uint8_t b = bytes[i + consumed];
            const uint8_t min = (consumed == 1) ? lo : 0x80;
            const uint8_t max = (consumed == 1) ? hi : 0xBF;
            if (b < min || b > max) {
                valid = false;
                break;
            }
        }

        if (valid) {
            out.append(reinterpret_cast<const char *>(&bytes[i]), len);
            i += len;
        } else {
            // drop the lead byte and any continuation bytes already accepted
            i += consumed;
        }
    }
    return out;
}

inline std::string jsonEscape(const std::string &s)
{
    std::ostringstream oss;
    for (unsigned char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << static_cast<char>(c);
                }
        }
    }
    return oss.str();
}

/**
 * @brief Textual representation of a value, used to coerce non-string input
 *        before scanning. Strings pass through, a null C string becomes "",
 *        bools become "True"/"False", numbers use their shortest usual form.
 */
template <typename T>
std::string toText(const T &value)
{
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "True" : "False";
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        return oss.str();
    } else {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
}

inline std::string toText(const std::string &value)
{
    return value;
}

inline std::string toText(const char *value)
{
    return value ? std::string(value) : std::string();
}

} // namespace text
} // namespace util
} // namespace safeintake

#endif // SAFEINTAKE_UTIL_TEXT_UTILS_HPP
