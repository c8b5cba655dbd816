#pragma once

// Convenience header pulling in the complete public API.
// Prefer the individual headers in code that only needs part of it.

#include <numvec/builders.hh>
#include <numvec/index_range.hh>
#include <numvec/operators.hh>
#include <numvec/span.hh>
#include <numvec/vector.hh>
