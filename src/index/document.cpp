#include "semroute/index/document.hpp"
#include "semroute/core/utils.hpp"

namespace semroute::index {

auto make_record_id(std::string_view label, std::string_view text) -> std::string {
    std::string raw;
    raw.reserve(label.size() + kIdSeparator.size() + text.size());
    raw.append(label).append(kIdSeparator).append(text);
    return utils::sha256(raw).substr(0, kIdLength);
}

auto make_record(std::string label, std::string text,
                 std::optional<json> structured_schema,
                 json metadata,
                 std::vector<float> vector) -> IndexedRecord {
    IndexedRecord record;
    record.id = make_record_id(label, text);
    record.label = std::move(label);
    record.text = std::move(text);
    if (structured_schema && !structured_schema->is_null()) {
        record.structured_schema = std::move(structured_schema);
    }
    record.metadata = metadata.is_null() ? json::object() : std::move(metadata);
    record.vector = std::move(vector);
    return record;
}

auto to_document(const IndexedRecord& record) -> json {
    return json{
        {"id", record.id},
        {kIdField, record.id},
        {kLabelField, record.label},
        {kTextField, record.text},
        {kSchemaField, record.structured_schema ? record.structured_schema->dump()
                                                : json(nullptr).dump()},
        {kMetadataField, record.metadata.dump()},
        {kVectorField, record.vector},
    };
}

auto payload_field(const json& document, std::string_view field) -> StoredPayload {
    auto it = document.find(std::string(field));
    if (it == document.end() || !it->is_string()) {
        return {};
    }
    auto raw = it->get<std::string>();
    if (raw.empty()) {
        return {};
    }
    return {.format = PayloadFormat::Json, .raw = std::move(raw)};
}

auto decode_payload(const StoredPayload& payload) -> Result<json> {
    if (payload.format == PayloadFormat::Absent) {
        return json(nullptr);
    }
    try {
        return json::parse(payload.raw);
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::MalformedPayload,
                       "Stored payload is not valid JSON", e.what()));
    }
}

namespace {

// Fields of the wrong type read as empty.
auto string_field(const json& document, std::string_view field) -> std::string {
    auto it = document.find(std::string(field));
    if (it == document.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

auto from_document(const json& document) -> StoredRecord {
    StoredRecord record;
    if (!document.is_object()) {
        return record;
    }
    record.id = string_field(document, kIdField);
    if (record.id.empty()) {
        record.id = string_field(document, "id");
    }
    record.label = string_field(document, kLabelField);
    record.text = string_field(document, kTextField);
    record.structured_schema = payload_field(document, kSchemaField);
    record.metadata = payload_field(document, kMetadataField);
    return record;
}

namespace {

auto label_clause(std::string_view op, std::string_view label) -> std::string {
    std::string expr(kLabelField);
    expr += op;
    expr += '`';
    expr += label;
    expr += '`';
    return expr;
}

} // anonymous namespace

auto label_equals(std::string_view label) -> std::string {
    return label_clause(":=", label);
}

auto label_not_equals(std::string_view label) -> std::string {
    return label_clause(":!=", label);
}

} // namespace semroute::index
