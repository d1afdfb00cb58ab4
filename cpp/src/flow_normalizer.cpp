#include "nfcollect/flow_normalizer.hpp"
#include "nfcollect/utils.hpp"

namespace nfcollect {

namespace {

FieldValue integer_or_hex(const std::vector<uint8_t>& bytes) {
    if (!bytes.empty() && bytes.size() <= 8) {
        return FieldValue::from_uint(utils::read_be(bytes.data(), bytes.size()));
    }
    return FieldValue::from_hex(utils::bytes_to_hex(bytes.data(), bytes.size()));
}

std::string trim_nul(const std::vector<uint8_t>& bytes) {
    size_t length = bytes.size();
    while (length > 0 && bytes[length - 1] == 0) {
        length--;
    }
    return std::string(bytes.begin(), bytes.begin() + length);
}

} // namespace

FieldValue FlowNormalizer::decode_value(const FieldSpec& spec, const std::vector<uint8_t>& bytes,
                                        ProtocolVersion version) {
    switch (field_kind(version, spec.type, spec.enterprise_number)) {
    case FieldKind::IPV4_ADDRESS:
        if (bytes.size() == 4) {
            return FieldValue::from_address(utils::uint32_to_ip_str(utils::read_be32(bytes.data())));
        }
        break;
    case FieldKind::IPV6_ADDRESS:
        if (bytes.size() == 16) {
            return FieldValue::from_address(utils::ipv6_bytes_to_str(bytes.data()));
        }
        break;
    case FieldKind::MAC_ADDRESS:
        if (bytes.size() == 6) {
            return FieldValue::from_mac(utils::mac_to_str(bytes.data()));
        }
        break;
    case FieldKind::TEXT:
        return FieldValue::from_text(trim_nul(bytes));
    case FieldKind::BYTES:
        return FieldValue::from_hex(utils::bytes_to_hex(bytes.data(), bytes.size()));
    case FieldKind::UNSIGNED:
        break;
    }

    return integer_or_hex(bytes);
}

FlowRecord FlowNormalizer::normalize(const DataRecord& record, ProtocolVersion version) const {
    FlowRecord flow;
    for (const auto& field : record.fields) {
        flow.set(field_name(version, field.spec.type, field.spec.enterprise_number),
                 decode_value(field.spec, field.value, version));
    }
    return flow;
}

std::vector<FlowRecord> FlowNormalizer::normalize(const DecodedPacket& packet) {
    std::vector<FlowRecord> flows;
    flows.reserve(packet.records.size());

    const ProtocolVersion version = packet.header.protocol();
    for (const auto& record : packet.records) {
        if (record.kind == TemplateKind::OPTIONS) {
            stats_.options_records++;
            continue;
        }
        flows.push_back(normalize(record, version));
        stats_.flows++;
    }
    return flows;
}

} // namespace nfcollect
