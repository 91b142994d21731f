#include "invalidation.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/type_resolver.h>
#include <google/protobuf/util/type_resolver_util.h>

#include <cmath>
#include <memory>

#include "internal/util/errors.hpp"

namespace notify::model {

namespace {

constexpr const char* kTypeUrlPrefix = "type.googleapis.com";

google::protobuf::util::TypeResolver* Resolver() {
  static const std::unique_ptr<google::protobuf::util::TypeResolver> resolver(
      google::protobuf::util::NewTypeResolverForDescriptorPool(kTypeUrlPrefix, google::protobuf::DescriptorPool::generated_pool()));
  return resolver.get();
}

void ValidateStruct(const google::protobuf::Struct& value, const std::string& path);

void ValidateValue(const google::protobuf::Value& value, const std::string& path) {
  switch (value.kind_case()) {
    case google::protobuf::Value::KIND_NOT_SET:
      throw util::EncodingError("invalidation value at '" + path + "' has no kind set");

    case google::protobuf::Value::kNumberValue:
      if (!std::isfinite(value.number_value())) {
        throw util::EncodingError("invalidation value at '" + path + "' is not a finite number");
      }
      break;

    case google::protobuf::Value::kListValue: {
      const auto& values = value.list_value().values();
      for (int i = 0; i < values.size(); ++i) {
        ValidateValue(values.Get(i), path + "[" + std::to_string(i) + "]");
      }
      break;
    }

    case google::protobuf::Value::kStructValue:
      ValidateStruct(value.struct_value(), path);
      break;

    default:
      break;
  }
}

void ValidateStruct(const google::protobuf::Struct& value, const std::string& path) {
  for (const auto& [key, field] : value.fields()) {
    ValidateValue(field, path.empty() ? key : path + "." + key);
  }
}

} // namespace

std::string EncodeInvalidation(const Invalidation& invalidation) {
  ValidateStruct(invalidation, "");

  // Deterministic wire form orders map entries by key, which the JSON
  // renderer then preserves.
  std::string binary;
  {
    google::protobuf::io::StringOutputStream raw(&binary);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!invalidation.SerializeToCodedStream(&coded)) {
      throw util::EncodingError("encode invalidation: protobuf serialization failed");
    }
  }

  std::string json;
  auto        status = google::protobuf::util::BinaryToJsonString(
      Resolver(), std::string(kTypeUrlPrefix) + "/" + Invalidation::descriptor()->full_name(), binary, &json);
  if (!status.ok()) {
    throw util::EncodingError("encode invalidation: " + std::string(status.message()));
  }
  return json;
}

std::optional<Invalidation> DecodeInvalidation(const db::model::NotificationRecord& record) {
  if (!record.invalidate.has_value()) {
    return std::nullopt;
  }

  Invalidation invalidation;
  auto         status = google::protobuf::util::JsonStringToMessage(*record.invalidate, &invalidation);
  if (!status.ok()) {
    throw util::EncodingError("decode invalidation for user " + std::to_string(record.user_id) + " notification " +
                              std::to_string(record.notification_id) + ": " + std::string(status.message()));
  }
  return invalidation;
}

void SetInvalidation(db::model::NotificationRecord& record, const Invalidation& invalidation) {
  record.invalidate = EncodeInvalidation(invalidation);
}

} // namespace notify::model
