#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gencore::util {

/*
  Step key helpers.

  Callers identify generation steps as "<namespace>:<generator>:<spec>".
  The build cache invalidates by generator, so the generator segment is
  compared exactly, never as a substring.
*/

std::vector<std::string> SplitStepKey(std::string_view step_key);

// Segment 1 of a colon-delimited key. A key without ':' is its own generator.
std::string GeneratorSegment(std::string_view step_key);

bool MatchesGenerator(std::string_view step_key, std::string_view generator);

std::string MakeStepKey(std::string_view ns, std::string_view generator, std::string_view spec);

} // namespace gencore::util
