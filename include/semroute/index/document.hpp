#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "semroute/core/error.hpp"

namespace semroute::index {

using json = nlohmann::json;

// Backend field names. The backend schema is flat, so structured payloads
// are stored as serialized strings.
inline constexpr char kIdField[] = "sr_id";
inline constexpr char kLabelField[] = "sr_route";
inline constexpr char kTextField[] = "sr_utterance";
inline constexpr char kSchemaField[] = "sr_function_schema";
inline constexpr char kMetadataField[] = "sr_metadata";
inline constexpr char kVectorField[] = "vec";

inline constexpr std::string_view kIdSeparator = "::";
inline constexpr size_t kIdLength = 16;

/// Reserved label for configuration pseudo-records. Never a route name.
inline constexpr std::string_view kConfigLabel = "__config__";

/// One (label, text) pair with its embedding and optional payloads.
struct IndexedRecord {
    std::string id;
    std::string label;
    std::string text;
    std::optional<json> structured_schema;
    json metadata = json::object();
    std::vector<float> vector;
};

/// First kIdLength hex chars of sha256(label + "::" + text). Identical
/// pairs always map to the same id, so re-indexing overwrites.
auto make_record_id(std::string_view label, std::string_view text) -> std::string;

auto make_record(std::string label, std::string text,
                 std::optional<json> structured_schema,
                 json metadata,
                 std::vector<float> vector) -> IndexedRecord;

/// Backend document for a record. Absent payloads serialize as "null"
/// (schema) and "{}" (metadata), never as a missing field.
auto to_document(const IndexedRecord& record) -> json;

enum class PayloadFormat {
    Absent,
    Json,
};

/// A serialized payload exactly as read back from the backend.
struct StoredPayload {
    PayloadFormat format = PayloadFormat::Absent;
    std::string raw;
};

auto payload_field(const json& document, std::string_view field) -> StoredPayload;

/// Absent decodes to null; undecodable JSON is a MalformedPayload error.
auto decode_payload(const StoredPayload& payload) -> Result<json>;

/// A route record read back from the backend, payloads still encoded.
struct StoredRecord {
    std::string id;
    std::string label;
    std::string text;
    StoredPayload structured_schema;
    StoredPayload metadata;
};

auto from_document(const json& document) -> StoredRecord;

/// `sr_route:=`label``, the label backquoted for the filter grammar.
auto label_equals(std::string_view label) -> std::string;

/// `sr_route:!=`label``
auto label_not_equals(std::string_view label) -> std::string;

} // namespace semroute::index
