#pragma once

#include <spdlog/spdlog.h>
#include <credo/execution/engine.hpp>
#include <credo/ledger/log_reader.hpp>

#include <cstdint>
#include <vector>

namespace credo::ledger {

struct apply_summary final {
  uint64_t blocks_applied{};
  uint64_t blocks_skipped{};
  uint64_t blocks_rejected{};
  uint64_t tx_succeeded{};
  uint64_t tx_failed{};
  int64_t committed_height{};
  credo::schema::hash32_t state_root{};
};

/// Finalize and commit every block above the committed height.
///
/// Blocks at or below the committed height are skipped, so a log can be
/// applied again after a restart. A block the engine refuses, such as one
/// timed before the committed block, is counted as rejected and not committed.
template <typename Library>
apply_summary apply_blocks(credo::execution::engine<Library>& engine,
                           const std::vector<ledger_block>& blocks) {
  auto summary = apply_summary{};
  for (const auto& block : blocks) {
    auto info = engine.info();
    if (static_cast<int64_t>(block.height) <= info.last_block_height) {
      ++summary.blocks_skipped;
      continue;
    }
    auto result = engine.finalize_block(block.height, block.block_time,
                                        block.txs);
    if (result.rejected) {
      ++summary.blocks_rejected;
      spdlog::error("Block {} at time {} rejected by the engine", block.height,
                    block.block_time);
      continue;
    }
    for (const auto& tx_result : result.tx_results) {
      if (tx_result.code == 0) {
        ++summary.tx_succeeded;
      } else {
        ++summary.tx_failed;
        spdlog::warn("Block {} transaction failed: code={} codespace={} {}",
                     block.height, tx_result.code, tx_result.codespace,
                     tx_result.log);
      }
    }
    engine.commit();
    ++summary.blocks_applied;
  }
  auto info = engine.info();
  summary.committed_height = info.last_block_height;
  summary.state_root = info.last_block_state_root;
  return summary;
}

}  // namespace credo::ledger
