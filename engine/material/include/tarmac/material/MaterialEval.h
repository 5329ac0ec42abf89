#pragma once

#include "tarmac/material/ElementContext.h"
#include "tarmac/material/Expression.h"
#include "tarmac/material/MaterialErrors.h"

namespace tarmac::material {

template<typename T>
struct EvalResult {
    bool success = false;
    T values;               // One entry per element on success, empty on failure
    MaterialError error;
};

using ColorResult = EvalResult<ColorArray>;
using ScalarResult = EvalResult<ScalarArray>;

// Evaluate an expression over every element of the context.
// Color-valued expressions read as scalars through Rec.709 luminance; scalar
// expressions read as colors by broadcasting. Neither call mutates its inputs,
// so independent evaluations may run on separate threads.
ColorResult EvaluateColor(const ExprRef& expression, const ElementContext& context);
ScalarResult EvaluateScalar(const ExprRef& expression, const ElementContext& context);

} // namespace tarmac::material
