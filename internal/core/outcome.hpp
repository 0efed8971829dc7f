#pragma once

#include <string_view>

namespace gencore::core {

/*
  Tag carried by every kind graph, build cache and generation plan result.

  None of these is an error: callers branch on the tag. Storage failures
  underneath an operation are thrown (see util/errors.hpp).
*/
enum class Outcome {
  Ok = 0,

  Exists,      // benign duplicate definition
  Invalid,     // self-loop, cycle, undefined kind, non-adjacent validate
  Unreachable, // no route
  NotFound,    // invalidate on an unknown step key

  Changed,   // cache miss: regenerate
  Unchanged, // cache hit: reuse prior output
};

std::string_view ToString(Outcome outcome);

} // namespace gencore::core
