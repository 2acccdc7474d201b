#include "optrisk/domain/position_json.hpp"
#include "optrisk/risk/i_reconciler.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace optrisk {

JsonFileReconciler::JsonFileReconciler(std::string path)
    : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// reconcilePositions(): read the file and parse it
// -----------------------------------------------------------------------------
std::vector<domain::Position> JsonFileReconciler::reconcilePositions() {
  std::ifstream in(path_);
  if (!in) {
    throw std::runtime_error("cannot open positions file: " + path_);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto positions = parse(buffer.str());
  std::cout << "[JsonFileReconciler] " << positions.size()
            << " open position(s) in " << path_ << "\n";
  return positions;
}

// -----------------------------------------------------------------------------
// parse(): array or {"positions": [...]}; bad entries are skipped
// -----------------------------------------------------------------------------
std::vector<domain::Position> JsonFileReconciler::parse(
    const std::string& json_text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("invalid positions file: ") +
                             e.what());
  }

  const nlohmann::json* entries = nullptr;
  if (root.is_array()) {
    entries = &root;
  } else if (root.is_object() && root.contains("positions") &&
             root["positions"].is_array()) {
    entries = &root["positions"];
  } else {
    throw std::runtime_error(
        "positions file must be an array or have a \"positions\" array");
  }

  std::vector<domain::Position> positions;
  positions.reserve(entries->size());
  for (const auto& entry : *entries) {
    try {
      positions.push_back(domain::positionFromJson(entry));
    } catch (const std::invalid_argument& e) {
      std::cerr << "[JsonFileReconciler] Skipping entry: " << e.what()
                << "\n";
    }
  }
  return positions;
}

}  // namespace optrisk
