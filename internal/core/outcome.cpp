#include "outcome.hpp"

namespace gencore::core {

std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::Ok:
      return "ok";
    case Outcome::Exists:
      return "exists";
    case Outcome::Invalid:
      return "invalid";
    case Outcome::Unreachable:
      return "unreachable";
    case Outcome::NotFound:
      return "notFound";
    case Outcome::Changed:
      return "changed";
    case Outcome::Unchanged:
      return "unchanged";
  }
  return "unknown";
}

} // namespace gencore::core
