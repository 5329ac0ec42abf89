#pragma once

#include "tarmac/material/Expression.h"
#include "tarmac/material/MaterialErrors.h"
#include "tarmac/material/MaterialGraph.h"

namespace tarmac::material {

struct ReifyResult {
    bool success = false;
    ExprRef expression;
    MaterialError error;
};

// Lower the value of a socket into an expression tree.
//
// `socket` may be an input pin (its link is followed, or its default becomes a
// constant) or an output pin (its node is lowered). Cycle detection is scoped
// to the current traversal path: a node reached through two separate branches
// is lowered once per branch, and only a node that feeds itself fails with
// MaterialErrorCode::Cycle.
//
// Group instances are inlined. The group body is lowered on its own, its
// group inputs become placeholders, and the placeholders are then replaced by
// the instance's inputs from the enclosing graph.
//
// The graph is never modified.
ReifyResult Reify(const MaterialGraph& graph, PinID socket);

} // namespace tarmac::material
