#include "config.h"
#include "logger.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace facewatch {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Whole-string numeric conversion; trailing garbage is not a number
template <typename T, typename Convert>
std::optional<T> parseNumber(const std::optional<std::string>& value, Convert convert) {
    if (!value || value->empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        T parsed = convert(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

enum class ValueKind { INT, DOUBLE, BOOL, CHOICE };

struct Rule {
    const char* section;
    const char* key;
    ValueKind kind;
    double min;
    double max;
    std::vector<std::string> choices;
};

const std::vector<Rule>& rules() {
    static const std::vector<Rule> table = {
        {"camera",      "width",               ValueKind::INT,    160,  3840,  {}},
        {"camera",      "height",              ValueKind::INT,    120,  2160,  {}},
        {"camera",      "fps",                 ValueKind::INT,    1,    120,   {}},
        {"detection",   "threshold",           ValueKind::DOUBLE, 0.0,  1.0,   {}},
        {"detection",   "input_width",         ValueKind::INT,    32,   2048,  {}},
        {"detection",   "input_height",        ValueKind::INT,    32,   2048,  {}},
        {"recognition", "classifier_encoding", ValueKind::CHOICE, 0,    0,     {"utf-8", "utf8", "latin1", "latin-1"}},
        {"recognition", "face_margin",         ValueKind::DOUBLE, 0.0,  1.0,   {}},
        {"recognition", "debug",               ValueKind::BOOL,   0,    0,     {}},
        {"notify",      "period_seconds",      ValueKind::DOUBLE, 0.1,  600.0, {}},
        {"notify",      "probability",         ValueKind::DOUBLE, 0.0,  1.0,   {}},
        {"notify",      "stay_seconds",        ValueKind::DOUBLE, 0.0,  86400.0, {}},
        {"notify",      "mode",                ValueKind::CHOICE, 0,    0,     {"any", "per_identity"}},
        {"control",     "enabled",             ValueKind::BOOL,   0,    0,     {}},
        {"control",     "port",                ValueKind::INT,    1,    65535, {}},
        {"logging",     "log_level",           ValueKind::CHOICE, 0,    0,     {"debug", "info", "warning", "warn", "error"}},
        {"logging",     "max_size_kb",         ValueKind::INT,    16,   1048576, {}},
        {"logging",     "syslog",              ValueKind::BOOL,   0,    0,     {}},
    };
    return table;
}

std::string joinChoices(const std::vector<std::string>& choices) {
    std::string joined;
    for (const auto& choice : choices) {
        if (!joined.empty()) joined += "|";
        joined += choice;
    }
    return joined;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::parseLine(const std::string& raw, int line_number, const std::string& path, std::string& section) {
    const std::string line = trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return true;
    }

    if (line[0] == '[') {
        if (line.back() != ']' || line.size() < 3) {
            validation_errors_.push_back(path + ":" + std::to_string(line_number) + ": malformed section header");
            return false;
        }
        section = trim(line.substr(1, line.size() - 2));
        data_[section];
        return true;
    }

    size_t pos = line.find('=');
    if (pos == std::string::npos || pos == 0) {
        validation_errors_.push_back(path + ":" + std::to_string(line_number) + ": expected key = value");
        return false;
    }

    data_[section][trim(line.substr(0, pos))] = unquote(trim(line.substr(pos + 1)));
    return true;
}

bool Config::load(const std::string& path) {
    validation_errors_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    bool well_formed = true;
    std::string section;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        well_formed &= parseLine(line, ++line_number, path, section);
    }

    bool valid = validate() && well_formed;

    if (!validation_errors_.empty()) {
        Logger::getInstance().warning("Configuration validation found " +
            std::to_string(validation_errors_.size()) + " issue(s):");
        for (const auto& error : validation_errors_) {
            Logger::getInstance().warning("  - " + error);
        }
    }

    return valid;
}

std::optional<std::string> Config::getString(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it == data_.end()) {
        return std::nullopt;
    }
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }
    return key_it->second;
}

std::optional<int> Config::getInt(const std::string& section, const std::string& key) const {
    return parseNumber<int>(getString(section, key), [](const std::string& s, size_t* pos) {
        return std::stoi(s, pos);
    });
}

std::optional<double> Config::getDouble(const std::string& section, const std::string& key) const {
    return parseNumber<double>(getString(section, key), [](const std::string& s, size_t* pos) {
        return std::stod(s, pos);
    });
}

std::optional<bool> Config::getBool(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    const std::string lower = toLower(*value);
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

bool Config::hasSection(const std::string& section) const {
    return data_.find(section) != data_.end();
}

void Config::clear() {
    data_.clear();
    validation_errors_.clear();
}

bool Config::validate() {
    bool all_valid = true;

    if (!hasSection("recognition")) {
        validation_errors_.push_back("Missing required config section: [recognition]");
        all_valid = false;
    }

    for (const auto& rule : rules()) {
        auto raw = getString(rule.section, rule.key);
        if (!raw) continue;

        const std::string name = std::string("[") + rule.section + "]." + rule.key;
        std::string problem;

        switch (rule.kind) {
            case ValueKind::INT: {
                auto value = getInt(rule.section, rule.key);
                if (!value) {
                    problem = " is not an integer";
                } else if (*value < rule.min || *value > rule.max) {
                    problem = " = " + *raw + " out of range [" + std::to_string(static_cast<int>(rule.min)) +
                              ", " + std::to_string(static_cast<int>(rule.max)) + "]";
                }
                break;
            }
            case ValueKind::DOUBLE: {
                auto value = getDouble(rule.section, rule.key);
                if (!value) {
                    problem = " is not a number";
                } else if (*value < rule.min || *value > rule.max) {
                    problem = " = " + *raw + " out of range [" + std::to_string(rule.min) +
                              ", " + std::to_string(rule.max) + "]";
                }
                break;
            }
            case ValueKind::BOOL:
                if (!getBool(rule.section, rule.key)) {
                    problem = " = " + *raw + " is not a boolean";
                }
                break;
            case ValueKind::CHOICE: {
                const std::string lower = toLower(*raw);
                if (std::find(rule.choices.begin(), rule.choices.end(), lower) == rule.choices.end()) {
                    problem = " = " + *raw + " must be one of " + joinChoices(rule.choices);
                }
                break;
            }
        }

        if (!problem.empty()) {
            validation_errors_.push_back(name + problem);
            all_valid = false;
        }
    }

    return all_valid;
}

} // namespace facewatch
