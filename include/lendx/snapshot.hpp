#ifndef LENDX_SNAPSHOT_HPP
#define LENDX_SNAPSHOT_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include "ledger.hpp"

namespace lendx {

class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Snapshot - JSON persistence of a LedgerState
//
// {
//   "version": 1, "paused": false,
//   "markets":   [ { "asset": "0x..", "total_supplied": "1000...", ... } ],
//   "positions": [ { "account": "0x..", "subaccount": 0, "asset": "0x..", ... } ],
//   "touched":   [ { "account": "0x..", "subaccount": 0, "assets": ["0x.."] } ],
//   "prices":    [ { "asset": "0x..", "price": "1000...", "timestamp": 0 } ]
// }
//
// 128-bit values are raw decimal integer strings.
// =============================================================================

namespace snapshot {

constexpr int VERSION = 1;

std::string to_json(const LedgerState& state);

// Throws SnapshotError on malformed JSON, unknown version or bad field
LedgerState from_json(std::string_view text);

// Write the pool's state to `path`; SNAPSHOT_IO on failure
int32_t save(const LendingPool& pool, const std::string& path);

// Replace the pool's state with the file at `path`. SNAPSHOT_IO on unreadable
// or malformed input, otherwise whatever import_state() returns.
int32_t load(LendingPool& pool, const std::string& path);

} // namespace snapshot

} // namespace lendx

#endif // LENDX_SNAPSHOT_HPP
