#pragma once

#include "optrisk/domain/position.hpp"

#include <string>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// IReconciler: startup discovery of positions opened in a previous session
// -----------------------------------------------------------------------------
//
// @brief  Returns the positions that are still open at the broker when the
//         engine starts, so they are managed from the first sweep.
//
// @details
// Each returned Position carries its persisted trailing state (peak profit,
// high-water-mark, trailing offset, breakeven flag). RiskManager hydrates
// them into PositionStore with PositionStore::hydrate(), which keeps that
// state, so a restart never loosens an already-tightened stop.
//
// Calling convention:
//   Called once, synchronously, on the main thread inside RiskManager::start()
//   before any thread is spawned.
//
// Ownership:
//   RiskManager receives a non-owning pointer in start() and does not keep it.
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  virtual std::vector<domain::Position> reconcilePositions() = 0;
};

// -----------------------------------------------------------------------------
// JsonFileReconciler: reads open positions from a JSON file
// -----------------------------------------------------------------------------
//
// @brief  The file is either an array of position objects or an object with a
//         "positions" array. The object shape is described in
//         optrisk/domain/position_json.hpp and must include "id".
//
// @details
// An entry that fails to parse is logged and skipped; the others are still
// returned.
//
// @throws std::runtime_error if the file cannot be opened or is not JSON of
//         one of the two accepted shapes.
// -----------------------------------------------------------------------------
class JsonFileReconciler : public IReconciler {
 public:
  explicit JsonFileReconciler(std::string path);

  std::vector<domain::Position> reconcilePositions() override;

  // Parses an in-memory document with the same rules as the file.
  static std::vector<domain::Position> parse(const std::string& json_text);

 private:
  std::string path_;
};

}  // namespace optrisk
