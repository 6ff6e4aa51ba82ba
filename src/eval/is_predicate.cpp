/***
 * Name: setalg::eval::isPredicate
 * Purpose: Distinguish true/false operations from construction operations.
 */
#include "setalg/eval/Evaluator.h"

namespace setalg::eval {

bool isPredicate(OpKind op) {
  switch (op) {
    case OpKind::Union:
    case OpKind::Intersect:
    case OpKind::SetDiff:
    case OpKind::SymDiff:
      return false;
    case OpKind::IsSubset:
    case OpKind::IsSuperset:
    case OpKind::ProperSubset:
    case OpKind::ProperSuperset:
    case OpKind::IsSetEqual:
    case OpKind::IsDisjoint:
      return true;
  }
  return false;
}

} // namespace setalg::eval
