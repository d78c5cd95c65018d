#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace veil {

/**
 * @brief Runtime configuration manager
 *
 * Holds codec knobs (output formats, redundancy ceiling, KDF cost,
 * document append limit) and logging settings as string key/values.
 * Thread-safe singleton. The stego core never reads it mid-operation;
 * CodecOptions::from_config() snapshots it before a call.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(key) != 0;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::invalid_argument&) { return default_val; }
        catch (const std::out_of_range&) { return default_val; }
    }

    uint64_t getUInt64(const std::string& key, uint64_t default_val = 0) const {
        std::string v = get(key);
        if (v.empty() || v[0] == '-') return default_val;
        try { return std::stoull(v); }
        catch (const std::invalid_argument&) { return default_val; }
        catch (const std::out_of_range&) { return default_val; }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) continue;

            values_[key] = val;
        }
        return true;
    }

    bool saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ofstream file(path);
        if (!file.is_open()) return false;

        file << "# VeilForge configuration\n";
        file << "# Auto-generated\n\n";
        for (const auto& [k, v] : values_) {
            file << k << " = " << v << "\n";
        }
        return static_cast<bool>(file);
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["log.level"] = "info";
        values_["log.file"] = "";
        values_["log.console"] = "true";
        values_["crypto.kdf_opslimit"] = "0";   // 0 = libsodium INTERACTIVE
        values_["crypto.kdf_memlimit"] = "0";
        values_["image.output_format"] = "png";
        values_["video.fourcc"] = "FFV1";
        values_["video.container"] = ".avi";
        values_["video.max_redundancy"] = "15";
        values_["video.threads"] = "0";         // 0 = hardware concurrency
        values_["document.max_append_bytes"] = "16777216";
        values_["security.memory_lock"] = "true";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    Config() { loadDefaults(); }

    static void trim(std::string& s) {
        s.erase(0, s.find_first_not_of(" \t"));
        auto last = s.find_last_not_of(" \t");
        if (last == std::string::npos) {
            s.clear();
        } else {
            s.erase(last + 1);
        }
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace veil
