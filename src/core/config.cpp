#include "selfcrypt/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace selfcrypt::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# selfcrypt configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value || value->empty() || value->front() == '-') {
        return default_value;
    }
    auto parsed = get_as<std::uint64_t>(key);
    return parsed ? *parsed : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["selfcrypt.max_chunk_size"] = "1048576";
    values_["selfcrypt.min_chunk_size"] = "1024";
    values_["selfcrypt.max_inline_map_bytes"] = "32768";
    values_["selfcrypt.max_map_depth"] = "8";
    values_["network.max_attempts"] = "5";
    values_["network.initial_backoff_ms"] = "50";
    values_["network.max_backoff_ms"] = "2000";
    values_["network.max_concurrent_requests"] = "8";
    values_["network.skip_existing"] = "true";
    values_["client.worker_threads"] = "0";
    values_["client.verify_checksum"] = "true";
    values_["storage.root"] = "selfcrypt-store";
    values_["storage.max_size"] = "10737418240";
    values_["log.level"] = "info";
    values_["log.file"] = "selfcrypt.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    
    if (start >= end) {
        return {};
    }
    return std::string(start, end);
}

}
