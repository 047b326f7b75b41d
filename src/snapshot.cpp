// =============================================================================
// snapshot.cpp - JSON persistence
// =============================================================================

#include "lendx/snapshot.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace lendx {

using json = nlohmann::json;

namespace {

json amount(I128 v) {
    return x18::to_string(v);
}

I128 amount_field(const json& j, const char* key) {
    std::string text = j.at(key).get<std::string>();
    auto v = x18::parse_int(text);
    if (!v) throw SnapshotError(std::string("Invalid integer for ") + key + ": " + text);
    return *v;
}

Currency currency_field(const json& j, const char* key) {
    std::string text = j.at(key).get<std::string>();
    auto addr = addresses::from_hex(text);
    if (!addr) throw SnapshotError(std::string("Invalid address for ") + key + ": " + text);
    return Currency{*addr};
}

Account account_field(const json& j) {
    Account account{};
    account.main = currency_field(j, "account").addr;
    account.subaccount_id = j.at("subaccount").get<uint16_t>();
    return account;
}

json encode_market(const Market& m) {
    return json{
        {"asset", addresses::to_hex(m.asset.addr)},
        {"active", m.active},
        {"total_supplied", amount(m.total_supplied_x18)},
        {"total_borrowed", amount(m.total_borrowed_x18)},
        {"supply_rate_per_second", amount(m.supply_rate_per_second_x18)},
        {"borrow_rate_per_second", amount(m.borrow_rate_per_second_x18)},
        {"reserve_factor", amount(m.reserve_factor_x18)},
        {"collateral_factor", amount(m.collateral_factor_x18)},
        {"liquidation_threshold", amount(m.liquidation_threshold_x18)},
        {"last_update_time", m.last_update_time},
        {"supply_index", amount(m.supply_index_x18)},
        {"borrow_index", amount(m.borrow_index_x18)}
    };
}

Market decode_market(const json& j) {
    Market m{};
    m.asset = currency_field(j, "asset");
    m.active = j.at("active").get<bool>();
    m.total_supplied_x18 = amount_field(j, "total_supplied");
    m.total_borrowed_x18 = amount_field(j, "total_borrowed");
    m.supply_rate_per_second_x18 = amount_field(j, "supply_rate_per_second");
    m.borrow_rate_per_second_x18 = amount_field(j, "borrow_rate_per_second");
    m.reserve_factor_x18 = amount_field(j, "reserve_factor");
    m.collateral_factor_x18 = amount_field(j, "collateral_factor");
    m.liquidation_threshold_x18 = amount_field(j, "liquidation_threshold");
    m.last_update_time = j.at("last_update_time").get<uint64_t>();
    m.supply_index_x18 = amount_field(j, "supply_index");
    m.borrow_index_x18 = amount_field(j, "borrow_index");
    return m;
}

}  // namespace

namespace snapshot {

std::string to_json(const LedgerState& state) {
    json markets = json::array();
    for (const auto& m : state.markets) {
        markets.push_back(encode_market(m));
    }

    json positions = json::array();
    json touched = json::array();
    for (const auto& [account, account_state] : state.accounts) {
        std::string owner = addresses::to_hex(account.main);

        for (const auto& [asset, p] : account_state.positions) {
            positions.push_back(json{
                {"account", owner},
                {"subaccount", account.subaccount_id},
                {"asset", addresses::to_hex(asset.addr)},
                {"supplied", amount(p.supplied_x18)},
                {"borrowed", amount(p.borrowed_x18)},
                {"supply_index_snapshot", amount(p.supply_index_snapshot_x18)},
                {"borrow_index_snapshot", amount(p.borrow_index_snapshot_x18)},
                {"is_collateral", p.is_collateral}
            });
        }

        json assets = json::array();
        for (const auto& asset : account_state.touched) {
            assets.push_back(addresses::to_hex(asset.addr));
        }
        touched.push_back(json{
            {"account", owner},
            {"subaccount", account.subaccount_id},
            {"assets", assets}
        });
    }

    json prices = json::array();
    for (const auto& [asset, data] : state.prices) {
        prices.push_back(json{
            {"asset", addresses::to_hex(asset.addr)},
            {"price", amount(data.price_x18)},
            {"timestamp", data.timestamp}
        });
    }

    json doc{
        {"version", VERSION},
        {"paused", state.paused},
        {"markets", markets},
        {"positions", positions},
        {"touched", touched},
        {"prices", prices}
    };
    return doc.dump(2);
}

LedgerState from_json(std::string_view text) {
    try {
        json doc = json::parse(text);

        int version = doc.at("version").get<int>();
        if (version != VERSION) {
            throw SnapshotError("Unsupported snapshot version: " + std::to_string(version));
        }

        LedgerState state{};
        state.paused = doc.at("paused").get<bool>();

        for (const auto& jm : doc.at("markets")) {
            state.markets.push_back(decode_market(jm));
        }

        for (const auto& jp : doc.at("positions")) {
            Position p{};
            p.asset = currency_field(jp, "asset");
            p.supplied_x18 = amount_field(jp, "supplied");
            p.borrowed_x18 = amount_field(jp, "borrowed");
            p.supply_index_snapshot_x18 = amount_field(jp, "supply_index_snapshot");
            p.borrow_index_snapshot_x18 = amount_field(jp, "borrow_index_snapshot");
            p.is_collateral = jp.at("is_collateral").get<bool>();

            auto& positions = state.accounts[account_field(jp)].positions;
            if (!positions.emplace(p.asset, p).second) {
                throw SnapshotError("Duplicate position for " + addresses::to_hex(p.asset.addr));
            }
        }

        for (const auto& jt : doc.at("touched")) {
            auto& list = state.accounts[account_field(jt)].touched;
            for (const auto& ja : jt.at("assets")) {
                auto addr = addresses::from_hex(ja.get<std::string>());
                if (!addr) throw SnapshotError("Invalid touched asset: " + ja.dump());
                list.push_back(Currency{*addr});
            }
        }

        for (const auto& jq : doc.at("prices")) {
            PriceData data{};
            data.price_x18 = amount_field(jq, "price");
            data.timestamp = jq.at("timestamp").get<uint64_t>();
            state.prices.emplace_back(currency_field(jq, "asset"), data);
        }

        return state;
    } catch (const json::exception& e) {
        throw SnapshotError(std::string("Malformed snapshot: ") + e.what());
    }
}

int32_t save(const LendingPool& pool, const std::string& path) {
    std::string text = to_json(pool.export_state());

    std::ofstream file{path, std::ios::trunc};
    if (!file.is_open()) return errors::SNAPSHOT_IO;
    file << text;
    file.flush();
    return file.good() ? errors::OK : errors::SNAPSHOT_IO;
}

int32_t load(LendingPool& pool, const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        pool.logger().error("snapshot", "cannot open ", path);
        return errors::SNAPSHOT_IO;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LedgerState state;
    try {
        state = from_json(buffer.str());
    } catch (const SnapshotError& e) {
        pool.logger().error("snapshot", path, ": ", e.what());
        return errors::SNAPSHOT_IO;
    }
    return pool.import_state(state);
}

} // namespace snapshot

} // namespace lendx
