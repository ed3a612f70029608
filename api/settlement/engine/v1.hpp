#pragma once

#include "settlement/engine/core/v1/ledger.pb.h"

#include "settlement/engine/events/v1/envelope.pb.h"

#include "settlement/engine/services/v1/admin_service.pb.h"
#include "settlement/engine/services/v1/payout_service.pb.h"
#include "settlement/engine/services/v1/webhook_service.pb.h"

#include "settlement/engine/services/v1/admin_service.grpc.pb.h"
#include "settlement/engine/services/v1/payout_service.grpc.pb.h"
#include "settlement/engine/services/v1/webhook_service.grpc.pb.h"

namespace settlement::engine::v1 {
using namespace ::settlement::engine::core::v1;
using namespace ::settlement::engine::events::v1;
using namespace ::settlement::engine::services::v1;
}
