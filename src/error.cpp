/*
 *
 *  error.cpp
 *
 */

#include "rdc/error.hpp"
#include "rdc/write.hpp"

namespace rdc {

const char *StatusCodeName(StatusCode code) {
  switch (code) {
    case StatusCode::kOk: return "Ok";
    case StatusCode::kDeviceUnavailable: return "DeviceUnavailable";
    case StatusCode::kNotInitialized: return "NotInitialized";
    case StatusCode::kInvalidArgument: return "InvalidArgument";
    case StatusCode::kQueueUnavailable: return "QueueUnavailable";
    case StatusCode::kCreditExhausted: return "CreditExhausted";
    case StatusCode::kRegistrationRequired: return "RegistrationRequired";
    case StatusCode::kRegionConflict: return "RegionConflict";
    case StatusCode::kRegionInUse: return "RegionInUse";
    case StatusCode::kConnectionLost: return "ConnectionLost";
    case StatusCode::kTransportError: return "TransportError";
    case StatusCode::kShuttingDown: return "ShuttingDown";
    case StatusCode::kAlreadyFailed: return "AlreadyFailed";
    case StatusCode::kTimeout: return "Timeout";
    case StatusCode::kInternal: return "Internal";
  }
  return "Unknown";
}

const char *QueueStateName(QueueState state) {
  switch (state) {
    case QueueState::kUnbound: return "Unbound";
    case QueueState::kConnecting: return "Connecting";
    case QueueState::kConnected: return "Connected";
    case QueueState::kDraining: return "Draining";
    case QueueState::kClosed: return "Closed";
    case QueueState::kError: return "Error";
  }
  return "Unknown";
}

}
