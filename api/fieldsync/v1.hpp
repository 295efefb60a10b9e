#pragma once

#include "fieldsync/v1/gateway.pb.h"
#include "fieldsync/v1/job.pb.h"
#include "fieldsync/v1/queue.pb.h"

#if FIELDSYNC_WITH_GRPC
#include "fieldsync/v1/gateway.grpc.pb.h"
#endif
