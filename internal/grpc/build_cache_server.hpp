#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "api/gencore/v1.hpp"
#include "internal/service/build_cache_service.hpp"

namespace gencore::grpc {

class BuildCacheServer final : public gencore::v1::BuildCacheService::Service {
public:
  explicit BuildCacheServer(std::shared_ptr<gencore::service::BuildCacheService> svc);

  ::grpc::Status Check(::grpc::ServerContext*,
                       const gencore::v1::CheckRequest*,
                       gencore::v1::CheckResponse*) override;

  ::grpc::Status Record(::grpc::ServerContext*,
                        const gencore::v1::RecordRequest*,
                        gencore::v1::RecordResponse*) override;

  ::grpc::Status Invalidate(::grpc::ServerContext*,
                            const gencore::v1::InvalidateRequest*,
                            gencore::v1::InvalidateResponse*) override;

  ::grpc::Status InvalidateBySource(::grpc::ServerContext*,
                                    const gencore::v1::InvalidateBySourceRequest*,
                                    gencore::v1::InvalidateBySourceResponse*) override;

  ::grpc::Status InvalidateByKind(::grpc::ServerContext*,
                                  const gencore::v1::InvalidateByKindRequest*,
                                  gencore::v1::InvalidateByKindResponse*) override;

  ::grpc::Status InvalidateAll(::grpc::ServerContext*,
                               const gencore::v1::InvalidateAllRequest*,
                               gencore::v1::InvalidateAllResponse*) override;

  ::grpc::Status Status(::grpc::ServerContext*,
                        const gencore::v1::CacheStatusRequest*,
                        gencore::v1::CacheStatusResponse*) override;

  ::grpc::Status StaleSteps(::grpc::ServerContext*,
                            const gencore::v1::StaleStepsRequest*,
                            gencore::v1::StaleStepsResponse*) override;

private:
  std::shared_ptr<gencore::service::BuildCacheService> service_;
};

} // namespace gencore::grpc
