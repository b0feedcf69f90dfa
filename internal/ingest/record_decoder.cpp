#include "record_decoder.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cstdint>
#include <cmath>
#include <limits>
#include <utility>

#include "internal/util/time.hpp"

namespace backupmon::ingest {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kUnknownCategory = "unknown";

std::string_view Trim(std::string_view s) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

RecordDecodeResult Reject(RejectReason reason, std::string detail) {
  RecordDecodeResult result;
  result.reason = reason;
  result.detail = std::move(detail);
  return result;
}

const Value* Find(const Struct& object, const char* field) {
  auto it = object.fields().find(field);
  if (it == object.fields().end()) return nullptr;
  return &it->second;
}

bool IsUnset(const Value* value) {
  return value == nullptr || value->kind_case() == Value::kNullValue;
}

// Non-negative integer from a JSON number (truncated), bool or decimal string.
std::optional<uint64_t> CoerceCount(const Value& value) {
  switch (value.kind_case()) {
    case Value::kNumberValue: {
      const double truncated = std::trunc(value.number_value());
      if (!std::isfinite(truncated) || truncated < 0.0) return std::nullopt;
      if (truncated >= static_cast<double>(std::numeric_limits<uint64_t>::max())) return std::nullopt;
      return static_cast<uint64_t>(truncated);
    }
    case Value::kBoolValue:
      return value.bool_value() ? 1 : 0;
    case Value::kStringValue: {
      const auto text = Trim(value.string_value());
      if (text.empty()) return std::nullopt;
      uint64_t   parsed = 0;
      const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
      if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
      return parsed;
    }
    default:
      return std::nullopt;
  }
}

std::optional<bool> CoerceBool(const Value& value) {
  switch (value.kind_case()) {
    case Value::kBoolValue:
      return value.bool_value();
    case Value::kNumberValue:
      return value.number_value() != 0.0;
    case Value::kStringValue: {
      const auto text = Trim(value.string_value());
      if (text == "true" || text == "1") return true;
      if (text == "false" || text == "0") return false;
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

std::optional<std::string> CoerceId(const Value& value) {
  if (value.kind_case() == Value::kStringValue) {
    if (value.string_value().empty()) return std::nullopt;
    return value.string_value();
  }
  if (value.kind_case() == Value::kNumberValue) {
    const double number = value.number_value();
    if (!std::isfinite(number) || std::trunc(number) != number || std::fabs(number) > 9007199254740992.0) return std::nullopt;
    return std::to_string(static_cast<int64_t>(number));
  }
  return std::nullopt;
}

// Strings verbatim; anything else as its JSON text.
std::string ErrorText(const Value& value) {
  if (value.kind_case() == Value::kStringValue) return value.string_value();

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(value, &json).ok()) return {};
  return json;
}

bool RequireCount(const Struct& object, const char* field, uint64_t& out, RecordDecodeResult& failure) {
  const Value* value = Find(object, field);
  if (IsUnset(value)) {
    failure = Reject(RejectReason::kMissingField, field);
    return false;
  }
  auto count = CoerceCount(*value);
  if (!count) {
    failure = Reject(RejectReason::kInvalidField, field);
    return false;
  }
  out = *count;
  return true;
}

bool OptionalCount(const Struct& object, const char* field, uint64_t& out, RecordDecodeResult& failure) {
  const Value* value = Find(object, field);
  if (IsUnset(value) || (value->kind_case() == Value::kStringValue && Trim(value->string_value()).empty())) {
    out = 0;
    return true;
  }
  auto count = CoerceCount(*value);
  if (!count) {
    failure = Reject(RejectReason::kInvalidField, field);
    return false;
  }
  out = *count;
  return true;
}

} // namespace

const char* ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "none";
    case RejectReason::kMalformedJson:
      return "malformed_json";
    case RejectReason::kNotAnObject:
      return "not_an_object";
    case RejectReason::kMissingField:
      return "missing_field";
    case RejectReason::kInvalidField:
      return "invalid_field";
  }
  return "unknown";
}

bool IsBlankLine(std::string_view line) {
  return Trim(line).empty();
}

RecordDecodeResult DecodeRecord(std::string_view line) {
  Value parsed;
  auto  status = google::protobuf::util::JsonStringToMessage(std::string(Trim(line)), &parsed);
  if (!status.ok()) {
    return Reject(RejectReason::kMalformedJson, std::string(status.message()));
  }
  if (parsed.kind_case() != Value::kStructValue) {
    return Reject(RejectReason::kNotAnObject, "line is not a JSON object");
  }
  const Struct& object = parsed.struct_value();

  db::model::BackupRecord record;
  RecordDecodeResult            failure;

  // -- required -------------------------------------------------------

  const Value* timestamp = Find(object, "timestamp");
  if (IsUnset(timestamp)) return Reject(RejectReason::kMissingField, "timestamp");
  if (timestamp->kind_case() != Value::kStringValue || timestamp->string_value().empty()) {
    return Reject(RejectReason::kInvalidField, "timestamp");
  }
  // stored as UTC so lexicographic order, windows and eviction agree with time order
  auto utc = util::NormalizeIsoTimestamp(Trim(timestamp->string_value()));
  if (!utc) return Reject(RejectReason::kInvalidField, "timestamp");
  record.timestamp = std::move(*utc);

  const Value* backup_id = Find(object, "backup_id");
  if (IsUnset(backup_id)) return Reject(RejectReason::kMissingField, "backup_id");
  auto id = CoerceId(*backup_id);
  if (!id) return Reject(RejectReason::kInvalidField, "backup_id");
  record.backup_id = std::move(*id);

  const Value* success = Find(object, "success");
  if (IsUnset(success)) return Reject(RejectReason::kMissingField, "success");
  auto succeeded = CoerceBool(*success);
  if (!succeeded) return Reject(RejectReason::kInvalidField, "success");
  record.success = *succeeded;

  if (!RequireCount(object, "duration_total", record.duration_total, failure)) return failure;
  if (!RequireCount(object, "size_bytes", record.size_bytes, failure)) return failure;

  // -- optional -------------------------------------------------------

  if (!OptionalCount(object, "duration_snapshot", record.duration_snapshot, failure)) return failure;
  if (!OptionalCount(object, "duration_archive", record.duration_archive, failure)) return failure;
  if (!OptionalCount(object, "duration_volumes", record.duration_volumes, failure)) return failure;
  if (!OptionalCount(object, "duration_upload", record.duration_upload, failure)) return failure;
  if (!OptionalCount(object, "volume_bytes", record.volume_bytes, failure)) return failure;

  // -- error details, failed runs only -----------------------------------

  if (!record.success) {
    const Value* category = Find(object, "error_category");
    record.error_category = IsUnset(category) ? std::string(kUnknownCategory) : ErrorText(*category);

    const Value* message = Find(object, "error_message");
    if (!IsUnset(message)) record.error_message = ErrorText(*message);
  }

  RecordDecodeResult result;
  result.record = std::move(record);
  return result;
}

} // namespace backupmon::ingest
