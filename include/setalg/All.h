/**
 * @file
 * @brief Umbrella header for the set-algebra library.
 */
#pragma once

#include "setalg/algebra/Disjoint.h"
#include "setalg/algebra/FastIn.h"
#include "setalg/algebra/Filter.h"
#include "setalg/algebra/Fix2.h"
#include "setalg/algebra/Intersect.h"
#include "setalg/algebra/Ordering.h"
#include "setalg/algebra/SetDiff.h"
#include "setalg/algebra/SetEqual.h"
#include "setalg/algebra/Subset.h"
#include "setalg/algebra/SymDiff.h"
#include "setalg/algebra/Union.h"
#include "setalg/range/StepRange.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/ElementBound.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"
