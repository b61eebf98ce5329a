#include "cli/cli_parser.hpp"

#include "config/options.hpp"

#include <stdexcept>

namespace gifdraw {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) == 0) {
            std::string key = a.substr(2);
            std::string val = "true";
            if (i + 1 < argc) {
                std::string next = argv[i + 1] ? argv[i + 1] : "";
                if (next.rfind("--", 0) != 0) {
                    val = next;
                    ++i;
                }
            }
            kv_[key] = val;
        } else if (!a.empty()) {
            positional_.push_back(a);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

std::optional<int> CliParser::get_int(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return std::nullopt;
    const std::string& s = it->second;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw ConfigError("--" + key + " expects an integer, got '" + s + "'");
    }
    if (used != s.size()) throw ConfigError("--" + key + " expects an integer, got '" + s + "'");
    return v;
}

} // namespace gifdraw
