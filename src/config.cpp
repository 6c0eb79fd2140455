// Backstop - Configuration Implementation

#include "backstop/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace backstop {

using json = nlohmann::json;

namespace {

Address parse_address(const json& j, const char* key) {
    if (!j.is_string()) {
        throw std::runtime_error(std::string("Config field '") + key + "' must be a hex string");
    }
    auto addr = address_from_hex(j.get<std::string>());
    if (!addr) {
        throw std::runtime_error(std::string("Config field '") + key + "' is not a 20-byte hex address");
    }
    return *addr;
}

uint64_t parse_unsigned(const json& j, const char* key) {
    if (!j.is_number_unsigned()) {
        throw std::runtime_error(std::string("Config field '") + key + "' must be a non-negative integer");
    }
    return j.get<uint64_t>();
}

}  // namespace

BackstopConfig BackstopConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

BackstopConfig BackstopConfig::from_string(std::string_view content) {
    json j = json::parse(std::string(content), nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("Config is not valid JSON");
    }
    return from_json(j);
}

BackstopConfig BackstopConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    BackstopConfig config;
    try {
        if (j.contains("backstop_address")) {
            config.backstop_address = parse_address(j.at("backstop_address"), "backstop_address");
        }
        if (j.contains("admin")) {
            config.admin = parse_address(j.at("admin"), "admin");
        }
        if (j.contains("lock_period_seconds")) {
            config.lock_period_seconds = parse_unsigned(j.at("lock_period_seconds"), "lock_period_seconds");
        }
        if (j.contains("max_q4w_entries")) {
            config.max_q4w_entries = static_cast<size_t>(parse_unsigned(j.at("max_q4w_entries"), "max_q4w_entries"));
        }
        if (j.contains("restrict_donate")) {
            config.restrict_donate = j.at("restrict_donate").get<bool>();
        }
        if (j.contains("log_level")) {
            config.log_level = j.at("log_level").get<std::string>();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    if (config.max_q4w_entries == 0) {
        throw std::runtime_error("Invalid config: max_q4w_entries must be positive");
    }
    return config;
}

json BackstopConfig::to_json() const {
    return json{
        {"backstop_address", to_hex(backstop_address)},
        {"admin", to_hex(admin)},
        {"lock_period_seconds", lock_period_seconds},
        {"max_q4w_entries", max_q4w_entries},
        {"restrict_donate", restrict_donate},
        {"log_level", log_level},
    };
}

void configure_logging(const BackstopConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to off; keep the default level instead
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log level '{}', keeping '{}'", config.log_level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }
    spdlog::set_level(level);
}

}  // namespace backstop
