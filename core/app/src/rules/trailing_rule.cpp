#include "optrisk/rules/trailing_rule.hpp"

namespace optrisk {

Decision TrailingRule::evaluate(const domain::Position& position,
                                const RuleContext& context) {
  if (!(position.ltp > 0.0)) {
    return Decision::noAction();
  }
  return trailing_.evaluate(position, context);
}

}  // namespace optrisk
