#include "optrisk/rules/tiered_offset_rule.hpp"

namespace optrisk {

Decision TieredOffsetRule::evaluate(const domain::Position& position,
                                    const RuleContext& /*context*/) {
  if (position.ltp > 0.0) {
    trailing_.applyTieredOffset(position);
  }
  return Decision::noAction();
}

}  // namespace optrisk
