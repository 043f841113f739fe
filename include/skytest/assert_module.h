#pragma once

#include "skytest/value.h"

namespace skytest {

// The predeclared `assert` module: eq, ne, true, false, contains, fails,
// lt, le, gt, ge, len, empty, not_empty and snapshot. Failures throw
// AssertionError; snapshot() uses the SnapshotManager attached to the
// calling ExecutionContext.
Value make_assert_module();

} // namespace skytest
