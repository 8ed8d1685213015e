#ifndef DIFFGROWTH_SERIALIZATION_JSON_SERIALIZATION_HPP
#define DIFFGROWTH_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace diffgrowth::json {

// Version of the output format
constexpr const char* SERIALIZATION_VERSION = "0.1.0";

// Metadata wrapper for files written by the command-line tool
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
    std::string timestamp;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        j["step"] = step;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    static SerializedData from_json(const nlohmann::json& j) {
        SerializedData result;
        result.version = j.value("version", "unknown");
        result.step = j.value("step", "unknown");
        result.timestamp = j.value("timestamp", "");
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("stats")) result.stats = j["stats"];
        if (!j.contains("data")) {
            throw std::runtime_error("Serialized file has no \"data\" section");
        }
        result.data = j["data"];
        return result;
    }
};

// Current time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

inline SerializedData read_serialized(const std::string& path) {
    return SerializedData::from_json(read_json_file(path));
}

}  // namespace diffgrowth::json

#endif // DIFFGROWTH_SERIALIZATION_JSON_SERIALIZATION_HPP
