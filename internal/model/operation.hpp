#pragma once

#include <cstdint>
#include <string>

namespace notify::model {

/*
  Identity and timing of the change that triggers a notification.
  Owned by the caller's operation subsystem; read-only here.
*/
struct OperationContext {
  int64_t     user_id   = 0;
  int64_t     device_id = 0;
  std::string operation_id;
  uint64_t    timestamp_ms = 0;
};

} // namespace notify::model
