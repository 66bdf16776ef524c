#pragma once

#include <credo/schema/primitives.hpp>

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Ledger log: text file, one transaction per line as
// `<height> <block_time_ms> <base64 SCALE transaction>`. Blank lines and
// lines starting with '#' are ignored. Consecutive lines with the same height
// form one block.
namespace credo::ledger {

struct ledger_block final {
  uint64_t height{};
  credo::schema::timestamp_milliseconds_t block_time{};
  std::vector<credo::schema::bytes_t> txs;
};

/// Parse a ledger stream into blocks.
///
/// Returns std::nullopt and sets `error` (with the 1-based line number) on a
/// malformed line, a decreasing height, or a block whose lines disagree on
/// block time.
std::optional<std::vector<ledger_block>> parse_ledger(std::istream& input,
                                                      std::string& error);

/// Open and parse a ledger file.
std::optional<std::vector<ledger_block>> load_ledger(std::string_view path,
                                                     std::string& error);

/// Render one ledger line.
std::string format_ledger_line(uint64_t height,
                               credo::schema::timestamp_milliseconds_t block_time,
                               const credo::schema::bytes_t& tx);

}  // namespace credo::ledger
