/**
 * @file
 * @brief Command line spellings of the evaluator operations.
 */
#pragma once

#include <array>
#include <string_view>
#include <utility>

#include "setalg/eval/Evaluator.h"

namespace setalg::eval::detail {

inline constexpr std::array<std::pair<std::string_view, OpKind>, 10> kOpTable{{
    {"union", OpKind::Union},
    {"intersect", OpKind::Intersect},
    {"setdiff", OpKind::SetDiff},
    {"symdiff", OpKind::SymDiff},
    {"issubset", OpKind::IsSubset},
    {"issuperset", OpKind::IsSuperset},
    {"psubset", OpKind::ProperSubset},
    {"psuperset", OpKind::ProperSuperset},
    {"issetequal", OpKind::IsSetEqual},
    {"isdisjoint", OpKind::IsDisjoint},
}};

} // namespace setalg::eval::detail
