#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace gencore::service {

/*
  Runs one RPC body. Failures are logged with the route and elapsed time,
  then rethrown for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
    GENCORE_LOG_ERROR("RPC failed", {gencore::observability::StringField("route", route), gencore::observability::StringField("error", ex.what()),
                                     gencore::observability::IntField("elapsed_ms", elapsed_ms)});
    throw;
  }
}

} // namespace gencore::service
