#pragma once

#include <sc/issue.h>
#include <sc/value.h>

namespace sc {

struct MergeResult {
    bool ok = true;
    Value value;
    // Location of the first conflict when !ok
    Path conflict;
};

// Structural merge used by intersections: null yields the other side,
// objects union their keys and merge shared ones, arrays of equal length
// merge element-wise, anything else must be deeply equal.
MergeResult merge_values(const Value& a, const Value& b);

}  // namespace sc
