#ifndef IDREDACT_UTIL_CONFIG_PARSER_HPP
#define IDREDACT_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <stdexcept>
#include <cstdint>
#include <limits>
#include <mutex>
#include "../../config/redactor_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" configuration file into a RedactorConfig.
 *
 * FORMAT:
 *   # comment
 *   placeholder=<ID>
 *   patternFile=patterns/latam.conf
 *   workerThreads=4
 *   regexLocale=C.UTF-8
 *   logLevel=debug
 *   logFile=idredact.log
 *   maxEntityTextLength=100000
 *
 * USAGE:
 *   @code
 *   idredact::config::RedactorConfig cfg;
 *   idredact::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("idredact.conf");
 *   @endcode
 *
 * Values are taken verbatim after trimming, so a placeholder may contain
 * inner spaces but not leading or trailing ones.
 */

namespace idredact {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(idredact::config::RedactorConfig &redactorConfig)
        : config_(redactorConfig)
    {
    }

    /**
     * @brief Read the given file line by line, storing recognized keys.
     *        A missing file is logged and leaves the defaults in place.
     * @return false if the file could not be opened.
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            idredact::util::logger::warn("ConfigParser: File not found: " + filepath);
            return false;
        }

        idredact::util::logger::info("ConfigParser: Loading config from " + filepath);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }

        idredact::util::logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Apply a single key/value pair, as if it had been read from a file.
     * @throw std::runtime_error on an invalid value.
     */
    inline void set(const std::string &key, const std::string &val)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        applyKeyValue(key, val);
    }

private:
    idredact::config::RedactorConfig &config_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "placeholder") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: placeholder must not be empty");
            }
            config_.placeholder = val;
            idredact::util::logger::debug("ConfigParser: placeholder set to " + val);
        }
        else if (key == "patternFile") {
            config_.patternFile = val;
            idredact::util::logger::debug("ConfigParser: patternFile set to " + val);
        }
        else if (key == "workerThreads") {
            uint64_t n = parseUInt(val);
            if (n > std::numeric_limits<uint32_t>::max()) {
                throw std::runtime_error("ConfigParser: workerThreads out of range: " + val);
            }
            config_.workerThreads = static_cast<uint32_t>(n);
            idredact::util::logger::debug("ConfigParser: workerThreads set to " + std::to_string(config_.workerThreads));
        }
        else if (key == "regexLocale") {
            config_.regexLocale = val;
            idredact::util::logger::debug("ConfigParser: regexLocale set to " + val);
        }
        else if (key == "logLevel") {
            // validate early so a typo fails at load time
            idredact::util::logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "maxEntityTextLength") {
            config_.maxEntityTextLength = parseUInt(val);
            idredact::util::logger::debug("ConfigParser: maxEntityTextLength set to " +
                                          std::to_string(config_.maxEntityTextLength));
        }
        else {
            idredact::util::logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    /**
     * @brief Parse a string into an unsigned integer. If invalid, throw.
     */
    inline uint64_t parseUInt(const std::string &val) const
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace idredact

#endif // IDREDACT_UTIL_CONFIG_PARSER_HPP
