#ifndef LENDX_CONFIG_HPP
#define LENDX_CONFIG_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

#include "market.hpp"

namespace lendx {

// Malformed or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// General ledger settings
struct GeneralConfig {
    std::string log_level = "info";
    uint64_t seconds_per_year = constants::SECONDS_PER_YEAR;
    std::string snapshot_path;  // restored by bootstrap when the file exists
};

// =============================================================================
// Config - ledger settings and the markets to register at startup
// =============================================================================

class Config {
public:
    GeneralConfig general;
    std::map<std::string, MarketParams> markets;  // name -> params

    Config() = default;

    // Load from TOML file; throws ConfigError
    static Config from_file(std::string_view path);

    // Load from TOML string; throws ConfigError
    static Config from_toml(std::string_view content);

    // Builder methods
    Config& with_market(std::string_view name, const MarketParams& params) {
        markets[std::string(name)] = params;
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_snapshot_path(std::string_view path) {
        general.snapshot_path = std::string(path);
        return *this;
    }
};

} // namespace lendx

#endif // LENDX_CONFIG_HPP
