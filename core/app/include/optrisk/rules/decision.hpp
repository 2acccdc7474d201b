#pragma once

#include <string>
#include <utility>

namespace optrisk {

enum class ExitAction {
  NoAction,
  Exit,
};

// -----------------------------------------------------------------------------
// Decision: outcome of one exit rule for one position
// -----------------------------------------------------------------------------
// reason  machine-readable exit reason ("stop_loss_hit", "time_stop", ...);
//         it is what ends up on the position record and in notifications.
// rule    name of the rule that produced the decision, for logs/telemetry.
// -----------------------------------------------------------------------------
struct Decision {
  ExitAction action{ExitAction::NoAction};
  std::string reason;
  std::string rule;

  bool isExit() const { return action == ExitAction::Exit; }

  static Decision noAction() { return Decision{}; }

  static Decision exit(std::string reason, std::string rule) {
    return Decision{ExitAction::Exit, std::move(reason), std::move(rule)};
  }
};

}  // namespace optrisk
