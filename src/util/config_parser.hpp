#ifndef SAFEINTAKE_UTIL_CONFIG_PARSER_HPP
#define SAFEINTAKE_UTIL_CONFIG_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include "config/intake_config.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" file into config::IntakeConfig.
 *
 * FORMAT:
 *   - One setting per line: rawBucket=my-raw-bucket
 *   - Lines starting with '#' and blank lines are ignored.
 *   - Whitespace around keys and values is trimmed.
 *   - Unknown keys are logged and skipped.
 *
 * USAGE:
 *   @code
 *   safeintake::config::IntakeConfig cfg;
 *   safeintake::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("safeintake.conf");
 *   @endcode
 */

namespace safeintake {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(safeintake::config::IntakeConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Load settings from a file. A missing file keeps the defaults.
     * @return true if the file was found and applied.
     * @throw std::runtime_error on a malformed line or an invalid value.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("[ConfigParser] Config loaded.");
        return true;
    }

    /**
     * @brief Parse settings from any input stream.
     * @throw std::runtime_error on a malformed line or an invalid value.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            line = text::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            const std::string key = text::trim(line.substr(0, pos));
            const std::string val = text::trim(line.substr(pos + 1));

            applyKeyValue(key, val);
        }
    }

private:
    safeintake::config::IntakeConfig &config_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "rawBucket") {
            config_.rawBucket = requireNonEmpty(key, val);
        }
        else if (key == "processedBucket") {
            config_.processedBucket = requireNonEmpty(key, val);
        }
        else if (key == "useLocalStorage") {
            config_.useLocalStorage = parseBool(key, val);
        }
        else if (key == "storageRoot") {
            config_.storageRoot = requireNonEmpty(key, val);
        }
        else if (key == "objectStoreEndpoint") {
            config_.objectStoreEndpoint = val;
        }
        else if (key == "objectStoreToken") {
            config_.objectStoreToken = val;
            // never echo the token
            logger::debug("[ConfigParser] objectStoreToken set");
            return;
        }
        else if (key == "databasePath") {
            config_.databasePath = requireNonEmpty(key, val);
        }
        else if (key == "logLevel") {
            logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "workerThreads") {
            config_.workerThreads = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "tableParallelThreshold") {
            config_.tableParallelThreshold = static_cast<std::size_t>(parseUInt(key, val));
        }
        else if (key == "maskEmail") {
            config_.maskEmail = parseBool(key, val);
        }
        else if (key == "maskSsn") {
            config_.maskSsn = parseBool(key, val);
        }
        else if (key == "maskDateOfBirth") {
            config_.maskDateOfBirth = parseBool(key, val);
        }
        else if (key == "maskCreditCard") {
            config_.maskCreditCard = parseBool(key, val);
        }
        else if (key == "maskPhone") {
            config_.maskPhone = parseBool(key, val);
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "' ignored");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    inline static const std::string &requireNonEmpty(const std::string &key, const std::string &val)
    {
        if (val.empty()) {
            throw std::runtime_error("ConfigParser: '" + key + "' must not be empty");
        }
        return val;
    }

    inline static bool parseBool(const std::string &key, const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: '" + key + "' expects a boolean, got '" + val + "'");
    }

    inline static uint64_t parseUInt(const std::string &key, const std::string &val)
    {
        if (val.empty() || !std::all_of(val.begin(), val.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::runtime_error("ConfigParser: '" + key + "' expects an unsigned integer, got '" +
                                     val + "'");
        }
        try {
            return std::stoull(val, nullptr, 10);
        }
        catch (const std::out_of_range &) {
            throw std::runtime_error("ConfigParser: '" + key + "' is out of range: " + val);
        }
    }
};

} // namespace util
} // namespace safeintake

#endif // SAFEINTAKE_UTIL_CONFIG_PARSER_HPP
