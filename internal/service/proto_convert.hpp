#pragma once

#include "gencore/v1/types.pb.h"
#include "internal/core/outcome.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/kind_record.hpp"
#include "internal/db/model/run_record.hpp"

namespace gencore::service {

gencore::v1::Outcome ToProto(gencore::core::Outcome outcome);
gencore::v1::RunState ToProto(gencore::db::model::RunStatus status);

gencore::v1::Kind ToProto(const gencore::db::model::KindRecord& record);
gencore::v1::Edge ToProto(const gencore::db::model::EdgeRecord& record);
gencore::v1::CacheEntry ToProto(const gencore::db::model::CacheEntryRecord& record);
gencore::v1::Run ToProto(const gencore::db::model::RunRecord& record);

} // namespace gencore::service
