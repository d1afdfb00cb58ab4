#include "nfcollect/flow_record.hpp"

namespace nfcollect {

FieldValue FieldValue::from_uint(uint64_t value) {
    FieldValue field;
    field.kind = Kind::UNSIGNED;
    field.number = value;
    return field;
}

FieldValue FieldValue::from_address(const std::string& address) {
    FieldValue field;
    field.kind = Kind::ADDRESS;
    field.text = address;
    return field;
}

FieldValue FieldValue::from_mac(const std::string& mac) {
    FieldValue field;
    field.kind = Kind::MAC;
    field.text = mac;
    return field;
}

FieldValue FieldValue::from_text(const std::string& value) {
    FieldValue field;
    field.kind = Kind::TEXT;
    field.text = value;
    return field;
}

FieldValue FieldValue::from_hex(const std::string& hex) {
    FieldValue field;
    field.kind = Kind::BYTES;
    field.text = hex;
    return field;
}

std::string FieldValue::to_string() const {
    if (kind == Kind::UNSIGNED) {
        return std::to_string(number);
    }
    return text;
}

bool operator==(const FieldValue& lhs, const FieldValue& rhs) {
    if (lhs.kind != rhs.kind) {
        return false;
    }
    return lhs.kind == FieldValue::Kind::UNSIGNED ? lhs.number == rhs.number
                                                  : lhs.text == rhs.text;
}

bool operator!=(const FieldValue& lhs, const FieldValue& rhs) {
    return !(lhs == rhs);
}

void FlowRecord::set(const std::string& name, FieldValue value) {
    for (auto& field : fields_) {
        if (field.first == name) {
            field.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(name, std::move(value));
}

bool FlowRecord::has(const std::string& name) const {
    return find(name) != nullptr;
}

const FieldValue* FlowRecord::find(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.first == name) {
            return &field.second;
        }
    }
    return nullptr;
}

std::optional<uint64_t> FlowRecord::get_uint(const std::string& name) const {
    const FieldValue* value = find(name);
    if (value == nullptr || !value->is_number()) {
        return std::nullopt;
    }
    return value->number;
}

std::optional<std::string> FlowRecord::get_text(const std::string& name) const {
    const FieldValue* value = find(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return value->to_string();
}

int FlowRecord::ip_version() const {
    auto version = get_uint(flow_key::IP_PROTOCOL_VERSION);
    if ((version && *version == 4) || has(flow_key::IPV4_SRC_ADDR) ||
        has(flow_key::IPV4_DST_ADDR)) {
        return 4;
    }
    return 6;
}

std::string FlowRecord::source_address() const {
    const char* key = ip_version() == 4 ? flow_key::IPV4_SRC_ADDR : flow_key::IPV6_SRC_ADDR;
    return get_text(key).value_or("");
}

std::string FlowRecord::destination_address() const {
    const char* key = ip_version() == 4 ? flow_key::IPV4_DST_ADDR : flow_key::IPV6_DST_ADDR;
    return get_text(key).value_or("");
}

uint16_t FlowRecord::source_port() const {
    return static_cast<uint16_t>(get_uint(flow_key::L4_SRC_PORT).value_or(0));
}

uint16_t FlowRecord::destination_port() const {
    return static_cast<uint16_t>(get_uint(flow_key::L4_DST_PORT).value_or(0));
}

uint8_t FlowRecord::protocol() const {
    return static_cast<uint8_t>(get_uint(flow_key::PROTOCOL).value_or(0));
}

bool operator==(const FlowRecord& lhs, const FlowRecord& rhs) {
    return lhs.fields() == rhs.fields();
}

} // namespace nfcollect
