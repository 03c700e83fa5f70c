#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;

    // Lines that were neither comments, section headers nor key/value pairs.
    const std::vector<std::string>& malformedLines() const { return malformed_lines; }

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    std::vector<std::string> malformed_lines;
};

#endif
