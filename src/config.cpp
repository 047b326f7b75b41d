// =============================================================================
// config.cpp - TOML configuration loader
// =============================================================================

#include "lendx/config.hpp"
#include "lendx/log.hpp"
#include <fstream>
#include <sstream>

namespace lendx {

// Simple TOML parser (sections, subsections, scalar key = value)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

I128 decimal_value(const std::string& key, const std::string& value) {
    auto parsed = x18::parse_decimal(value);
    if (!parsed) {
        throw ConfigError("Invalid decimal for " + key + ": " + value);
    }
    return *parsed;
}

uint64_t unsigned_value(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }

            if (current_section == "market" && !current_subsection.empty()) {
                MarketParams& params = config.markets[current_subsection];
                params = MarketParams{};
                params.initial_price_x18 = X18_ONE;
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") {
                if (!log::parse_level(value)) {
                    throw ConfigError("Unknown log_level: " + value);
                }
                config.general.log_level = value;
            }
            else if (key == "seconds_per_year") {
                config.general.seconds_per_year = unsigned_value(key, value);
                if (config.general.seconds_per_year == 0) {
                    throw ConfigError("seconds_per_year must be positive");
                }
            }
            else if (key == "snapshot_path") config.general.snapshot_path = value;
        }
        else if (current_section == "market" && !current_subsection.empty()) {
            auto& params = config.markets[current_subsection];
            if (key == "asset") {
                auto addr = addresses::from_hex(value);
                if (!addr) throw ConfigError("Invalid asset address: " + value);
                params.asset = Currency{*addr};
            }
            else if (key == "supply_rate") params.annual_supply_rate_x18 = decimal_value(key, value);
            else if (key == "borrow_rate") params.annual_borrow_rate_x18 = decimal_value(key, value);
            else if (key == "reserve_factor") params.reserve_factor_x18 = decimal_value(key, value);
            else if (key == "collateral_factor") params.collateral_factor_x18 = decimal_value(key, value);
            else if (key == "liquidation_threshold") params.liquidation_threshold_x18 = decimal_value(key, value);
            else if (key == "price") params.initial_price_x18 = decimal_value(key, value);
        }
    }

    return config;
}

} // namespace lendx
