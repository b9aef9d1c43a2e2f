// ============================================================================
// transport_base.cpp — result names shared by all transports
// ============================================================================

#include "fixturelink/transport/transport_base.hpp"

namespace fixturelink::transport {

// ---------------------------------------------------------------------------
// Result names for log lines
// ---------------------------------------------------------------------------
const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "unknown";
}

const char* to_string(RxResult r) {
  switch (r) {
    case RxResult::None:  return "none";
    case RxResult::Ok:    return "ok";
    case RxResult::Error: return "error";
  }
  return "unknown";
}

} // namespace fixturelink::transport
