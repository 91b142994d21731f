#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>

#include "internal/db/model/notification_record.hpp"

namespace notify::model {

/*
  Invalidation payload.

  Opaque to this library: a string-keyed mapping of recursively typed
  values telling the client which coarse-grained assets to re-fetch.
  Stored on the record as JSON text.
*/
using Invalidation = google::protobuf::Struct;

// Deterministic JSON form (keys sorted). Throws util::EncodingError.
std::string EncodeInvalidation(const Invalidation& invalidation);

// std::nullopt if the record never had an invalidation set.
std::optional<Invalidation> DecodeInvalidation(const db::model::NotificationRecord& record);

void SetInvalidation(db::model::NotificationRecord& record, const Invalidation& invalidation);

} // namespace notify::model
