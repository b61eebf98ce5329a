#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gifdraw {

// Small CLI parser:
//   --key value
//   --flag (treated as "true")
//   anything else is kept as a positional argument
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Throws ConfigError if present but not an integer.
    std::optional<int> get_int(const std::string& key) const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace gifdraw
