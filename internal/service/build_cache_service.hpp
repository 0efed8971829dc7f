#pragma once

#include "gencore/v1/build_cache_service.pb.h"
#include "service_context.hpp"

namespace gencore::service {

class BuildCacheService {
public:
  explicit BuildCacheService(ServiceContext ctx);

  gencore::v1::CheckResponse Check(const gencore::v1::CheckRequest& req);

  gencore::v1::RecordResponse Record(const gencore::v1::RecordRequest& req);

  gencore::v1::InvalidateResponse Invalidate(const gencore::v1::InvalidateRequest& req);

  gencore::v1::InvalidateBySourceResponse InvalidateBySource(const gencore::v1::InvalidateBySourceRequest& req);

  gencore::v1::InvalidateByKindResponse InvalidateByKind(const gencore::v1::InvalidateByKindRequest& req);

  gencore::v1::InvalidateAllResponse InvalidateAll(const gencore::v1::InvalidateAllRequest& req);

  gencore::v1::CacheStatusResponse Status(const gencore::v1::CacheStatusRequest& req);

  gencore::v1::StaleStepsResponse StaleSteps(const gencore::v1::StaleStepsRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace gencore::service
