#ifndef FACEWATCH_CONFIG_H
#define FACEWATCH_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <vector>

namespace facewatch {

// INI configuration: [section] headers, key = value pairs, '#' or ';'
// comment lines. Values may be double-quoted to keep surrounding blanks.
// Person records live in [person:<name>] sections.
class Config {
public:
    static Config& getInstance();

    // Parse an INI file on top of the current values. Returns false if the file
    // cannot be read, has malformed lines or fails validation
    // (see getValidationErrors()).
    bool load(const std::string& path);

    std::optional<std::string> getString(const std::string& section, const std::string& key) const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<double> getDouble(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

    bool hasSection(const std::string& section) const;

    void clear();

    std::vector<std::string> getValidationErrors() const { return validation_errors_; }

private:
    Config() = default;

    bool parseLine(const std::string& raw, int line_number, const std::string& path, std::string& section);
    bool validate();

    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> validation_errors_;
};

} // namespace facewatch

#endif // FACEWATCH_CONFIG_H
