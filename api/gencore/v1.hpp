#pragma once

#include "gencore/v1/types.pb.h"

#include "gencore/v1/kind_graph_service.pb.h"
#include "gencore/v1/build_cache_service.pb.h"
#include "gencore/v1/generation_plan_service.pb.h"

#include "gencore/v1/kind_graph_service.grpc.pb.h"
#include "gencore/v1/build_cache_service.grpc.pb.h"
#include "gencore/v1/generation_plan_service.grpc.pb.h"
