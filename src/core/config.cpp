#include "torrentcast/core/config.hpp"
#include "torrentcast/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace torrentcast::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // "[server]" followed by "port = 8080" is the same as "server.port = 8080".
    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = utils::StringUtils::trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = utils::StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::StringUtils::trim(line.substr(0, eq_pos));
        std::string value = utils::StringUtils::trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[section.empty() ? key : section + "." + key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# torrentcast configuration\n\n";

    // Unsectioned keys must precede the first [section] header.
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> sections;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            file << key << " = " << value << "\n";
        } else {
            sections[key.substr(0, dot)].emplace_back(key.substr(dot + 1), value);
        }
    }

    for (const auto& [section, entries] : sections) {
        file << "\n[" << section << "]\n";
        for (const auto& [key, value] : entries) {
            file << key << " = " << value << "\n";
        }
    }

    return file.good();
}

std::size_t Config::apply_environment(const EnvironmentLookup& lookup) {
    std::size_t applied = 0;

    if (auto port = lookup("PORT")) {
        values_["server.port"] = *port;
        ++applied;
    }

    // TORRENTCAST_SESSIONS_MAX_ACTIVE -> sessions.max_active
    std::vector<std::string> keys;
    for (const auto& [key, value] : values_) {
        keys.push_back(key);
    }
    for (const auto& key : keys) {
        std::string name = "TORRENTCAST_";
        for (char c : key) {
            name += c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (auto value = lookup(name)) {
            values_[key] = *value;
            ++applied;
        }
    }

    return applied;
}

std::size_t Config::apply_environment() {
    return apply_environment([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
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

    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(*value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto parsed = utils::StringUtils::parse_uint64(utils::StringUtils::trim(*value));
    return parsed ? *parsed : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> result;
    auto value = get(key);
    if (!value) return result;

    for (const auto& item : utils::StringUtils::split(*value, ',')) {
        auto trimmed = utils::StringUtils::trim(item);
        if (!trimmed.empty()) {
            result.push_back(trimmed);
        }
    }
    return result;
}

void Config::set_defaults() {
    values_["server.bind_address"] = "0.0.0.0";
    values_["server.port"] = "5000";
    values_["sessions.max_active"] = "3";
    values_["sessions.idle_timeout_seconds"] = "1800";
    values_["sessions.cleanup_interval_seconds"] = "300";
    values_["sessions.no_peer_grace_seconds"] = "10";
    values_["stream.chunk_size"] = "65536";
    values_["priority.buffer_ahead"] = "20";
    values_["priority.initial_window"] = "100";
    values_["engine.max_connections"] = "55";
    values_["engine.listen_port"] = "6881";
    values_["engine.scratch_directory"] =
        (std::filesystem::temp_directory_path() / "torrentcast").string();
    values_["search.endpoint"] = "https://apibay.org/q.php";
    values_["search.categories"] = "200,205,299";
    values_["search.timeout_seconds"] = "15";
    values_["log.level"] = "info";
    values_["log.file"] = "torrentcast.log";
}

}
