#include "step_key.hpp"

namespace gencore::util {

std::vector<std::string> SplitStepKey(std::string_view step_key) {
  std::vector<std::string> segments;
  std::size_t              start = 0;
  for (;;) {
    const auto pos = step_key.find(':', start);
    if (pos == std::string_view::npos) {
      segments.emplace_back(step_key.substr(start));
      break;
    }
    segments.emplace_back(step_key.substr(start, pos - start));
    start = pos + 1;
  }
  return segments;
}

std::string GeneratorSegment(std::string_view step_key) {
  auto segments = SplitStepKey(step_key);
  if (segments.size() < 2) {
    return std::string(step_key);
  }
  return segments[1];
}

bool MatchesGenerator(std::string_view step_key, std::string_view generator) {
  if (generator.empty()) {
    return false;
  }
  return GeneratorSegment(step_key) == generator;
}

std::string MakeStepKey(std::string_view ns, std::string_view generator, std::string_view spec) {
  std::string key;
  key.reserve(ns.size() + generator.size() + spec.size() + 2);
  key.append(ns).append(":").append(generator).append(":").append(spec);
  return key;
}

} // namespace gencore::util
