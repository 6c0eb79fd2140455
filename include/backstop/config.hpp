// Backstop - Configuration
// Builder pattern for fluent configuration, JSON loading

#ifndef BACKSTOP_CONFIG_HPP
#define BACKSTOP_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace backstop {

// 17 days
constexpr uint64_t DEFAULT_LOCK_PERIOD_SECONDS = 17 * 24 * 60 * 60;
constexpr size_t DEFAULT_MAX_Q4W_ENTRIES = 20;

class BackstopConfig {
public:
    Address backstop_address{};  // Custody account holding deposited tokens
    Address admin{};             // May register pools and draw
    uint64_t lock_period_seconds = DEFAULT_LOCK_PERIOD_SECONDS;
    size_t max_q4w_entries = DEFAULT_MAX_Q4W_ENTRIES;
    bool restrict_donate = false;  // Only the backed pool or admin may donate
    std::string log_level = "info";

    BackstopConfig() = default;

    // Load from JSON file; throws std::runtime_error on I/O or format errors
    static BackstopConfig from_file(std::string_view path);

    // Load from JSON text; throws std::runtime_error on format errors
    static BackstopConfig from_string(std::string_view content);
    static BackstopConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // Builder methods
    BackstopConfig& with_backstop_address(const Address& addr) {
        backstop_address = addr;
        return *this;
    }

    BackstopConfig& with_admin(const Address& addr) {
        admin = addr;
        return *this;
    }

    BackstopConfig& set_lock_period(uint64_t seconds) {
        lock_period_seconds = seconds;
        return *this;
    }

    BackstopConfig& set_max_q4w_entries(size_t n) {
        max_q4w_entries = n;
        return *this;
    }

    BackstopConfig& enable_donate_restriction(bool enabled = true) {
        restrict_donate = enabled;
        return *this;
    }

    BackstopConfig& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

// Apply log_level to the global spdlog logger
void configure_logging(const BackstopConfig& config);

} // namespace backstop

#endif // BACKSTOP_CONFIG_HPP
