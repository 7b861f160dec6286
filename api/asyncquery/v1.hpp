#pragma once

#include "asyncquery/v1/types.pb.h"
#include "asyncquery/v1/dispatch.pb.h"

#include "asyncquery/v1/async_query_service.pb.h"
#include "asyncquery/v1/worker_service.pb.h"

#include "asyncquery/v1/async_query_service.grpc.pb.h"
#include "asyncquery/v1/worker_service.grpc.pb.h"

#include "asyncquery/backend/v1/job_runner_service.pb.h"
#include "asyncquery/backend/v1/job_runner_service.grpc.pb.h"
