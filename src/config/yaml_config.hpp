//===----------------------------------------------------------------------===//
//                         PeerSync
//
// config/yaml_config.hpp
//
// YAML configuration file reader with dotted key paths
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace peersync {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
            return true;
        } catch (const YAML::BadFile& e) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    template<typename T>
    T Get(const std::string& path, const T& default_val) const {
        try {
            YAML::Node node = GetNode(path);
            if (node && !node.IsNull()) {
                return node.as<T>();
            }
        } catch (const YAML::Exception&) {
            // wrong type at this path, fall back to default
        }
        return default_val;
    }

    std::string GetString(const std::string& path, const std::string& default_val = "") const {
        return Get<std::string>(path, default_val);
    }

    int GetInt(const std::string& path, int default_val = 0) const {
        return Get<int>(path, default_val);
    }

    bool GetBool(const std::string& path, bool default_val = false) const {
        return Get<bool>(path, default_val);
    }

    // Accepts either a YAML sequence or a single comma separated scalar
    std::vector<std::string> GetStringList(const std::string& path) const {
        std::vector<std::string> result;
        YAML::Node node = GetNode(path);
        if (!node || node.IsNull()) {
            return result;
        }
        if (node.IsSequence()) {
            for (const auto& item : node) {
                result.push_back(item.as<std::string>());
            }
            return result;
        }
        std::string scalar = node.as<std::string>();
        size_t start = 0;
        while (start <= scalar.size()) {
            size_t comma = scalar.find(',', start);
            std::string item = scalar.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
            item.erase(0, item.find_first_not_of(" \t"));
            item.erase(item.find_last_not_of(" \t") + 1);
            if (!item.empty()) {
                result.push_back(item);
            }
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        return result;
    }

    bool Has(const std::string& path) const {
        YAML::Node node = GetNode(path);
        return node && !node.IsNull();
    }

    const std::string& GetError() const { return error_; }

private:
    // Walk a dot-separated path (e.g. "server.port")
    YAML::Node GetNode(const std::string& path) const {
        YAML::Node current = YAML::Clone(root_);

        size_t start = 0;
        size_t end;
        while ((end = path.find('.', start)) != std::string::npos) {
            std::string key = path.substr(start, end - start);
            if (!current.IsMap() || !current[key]) {
                return YAML::Node();
            }
            current = current[key];
            start = end + 1;
        }

        if (!current.IsMap()) {
            return YAML::Node();
        }
        return current[path.substr(start)];
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace peersync
