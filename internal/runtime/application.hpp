#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace gencore::runtime {

/*
  Application

  Core components plus the gRPC adapters serving them.
*/
struct Application {
  factory::Components components;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application BuildApplication(const gencore::runtime::config::RuntimeConfig& config);

} // namespace gencore::runtime
