//===----------------------------------------------------------------------===//
//                         PeerSync
//
// config/config_file.hpp
//
// Configuration file parser (key = value format)
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>

namespace peersync {

class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }

        std::string line;
        int line_num = 0;
        while (std::getline(file, line)) {
            line_num++;
            line = Trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                error_ = "Invalid syntax at line " + std::to_string(line_num);
                return false;
            }

            std::string key = Trim(line.substr(0, eq_pos));
            std::string value = Trim(line.substr(eq_pos + 1));

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            values_[key] = value;
        }

        return true;
    }

    std::string GetString(const std::string& key, const std::string& default_val = "") const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_val;
    }

    int GetInt(const std::string& key, int default_val = 0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            return default_val;
        }
    }

    bool GetBool(const std::string& key, bool default_val = false) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        std::string val = it->second;
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        return val == "true" || val == "yes" || val == "1" || val == "on";
    }

    // Comma separated list; empty items are dropped
    std::vector<std::string> GetStringList(const std::string& key) const {
        std::vector<std::string> result;
        auto it = values_.find(key);
        if (it == values_.end()) return result;
        std::istringstream iss(it->second);
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }

    bool Has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    const std::string& GetError() const { return error_; }

private:
    static std::string Trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r");
        return s.substr(begin, end - begin + 1);
    }

    std::unordered_map<std::string, std::string> values_;
    std::string error_;
};

} // namespace peersync
