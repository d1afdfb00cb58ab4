#include "nfcollect/packet_builder.hpp"
#include "nfcollect/packet_decoder.hpp"
#include "nfcollect/utils.hpp"
#include <stdexcept>

namespace nfcollect {

PacketBuilder::PacketBuilder(ProtocolVersion version, uint32_t unix_secs, uint32_t sequence,
                             uint32_t domain_id, uint32_t sys_uptime_ms)
    : version_(version), unix_secs_(unix_secs), sequence_(sequence),
      domain_id_(domain_id), sys_uptime_ms_(sys_uptime_ms), record_count_(0) {
}

void PacketBuilder::append_field_spec(std::vector<uint8_t>& out, const FieldSpec& spec) const {
    if (spec.enterprise_number != 0) {
        if (version_ != ProtocolVersion::IPFIX) {
            throw std::invalid_argument("Enterprise-specific fields require IPFIX");
        }
        utils::append_be(out, spec.type | 0x8000, 2);
        utils::append_be(out, spec.length, 2);
        utils::append_be(out, spec.enterprise_number, 4);
        return;
    }
    utils::append_be(out, spec.type, 2);
    utils::append_be(out, spec.length, 2);
}

void PacketBuilder::append_set(uint16_t set_id, const std::vector<uint8_t>& body, size_t records) {
    if (body.size() + SET_HEADER_LENGTH > 0xFFFF) {
        throw std::length_error("Set body too large: " + std::to_string(body.size()));
    }

    std::vector<uint8_t> set;
    set.reserve(body.size() + SET_HEADER_LENGTH);
    utils::append_be(set, set_id, 2);
    utils::append_be(set, body.size() + SET_HEADER_LENGTH, 2);
    set.insert(set.end(), body.begin(), body.end());

    sets_.push_back(std::move(set));
    record_count_ += records;
}

PacketBuilder& PacketBuilder::add_template(uint16_t template_id,
                                           const std::vector<FieldSpec>& fields) {
    std::vector<uint8_t> body;
    utils::append_be(body, template_id, 2);
    utils::append_be(body, fields.size(), 2);
    for (const auto& spec : fields) {
        append_field_spec(body, spec);
    }

    uint16_t set_id = version_ == ProtocolVersion::IPFIX ? IPFIX_TEMPLATE_SET_ID
                                                         : NETFLOW_V9_TEMPLATE_SET_ID;
    append_set(set_id, body, 1);
    return *this;
}

PacketBuilder& PacketBuilder::add_options_template(uint16_t template_id,
                                                   const std::vector<FieldSpec>& scope_fields,
                                                   const std::vector<FieldSpec>& option_fields) {
    std::vector<uint8_t> body;
    utils::append_be(body, template_id, 2);

    if (version_ == ProtocolVersion::IPFIX) {
        utils::append_be(body, scope_fields.size() + option_fields.size(), 2);
        utils::append_be(body, scope_fields.size(), 2);
    } else {
        // v9 announces the byte length of the scope and option specifiers
        utils::append_be(body, scope_fields.size() * 4, 2);
        utils::append_be(body, option_fields.size() * 4, 2);
    }

    for (const auto& spec : scope_fields) {
        append_field_spec(body, spec);
    }
    for (const auto& spec : option_fields) {
        append_field_spec(body, spec);
    }

    uint16_t set_id = version_ == ProtocolVersion::IPFIX ? IPFIX_OPTIONS_TEMPLATE_SET_ID
                                                         : NETFLOW_V9_OPTIONS_TEMPLATE_SET_ID;
    append_set(set_id, body, 1);
    return *this;
}

PacketBuilder& PacketBuilder::add_template_withdrawal(uint16_t template_id) {
    if (version_ != ProtocolVersion::IPFIX) {
        throw std::invalid_argument("Template withdrawal requires IPFIX");
    }

    std::vector<uint8_t> body;
    utils::append_be(body, template_id, 2);
    utils::append_be(body, 0, 2);
    append_set(IPFIX_TEMPLATE_SET_ID, body, 1);
    return *this;
}

PacketBuilder& PacketBuilder::add_data_set(uint16_t template_id,
                                           const std::vector<Record>& records,
                                           const std::vector<FieldSpec>& layout) {
    std::vector<uint8_t> body;

    for (const auto& record : records) {
        for (size_t i = 0; i < record.size(); ++i) {
            const Bytes& value = record[i];
            bool variable = version_ == ProtocolVersion::IPFIX && i < layout.size() &&
                            layout[i].is_variable_length();

            if (variable) {
                if (value.size() < 255) {
                    body.push_back(static_cast<uint8_t>(value.size()));
                } else {
                    if (value.size() > 0xFFFF) {
                        throw std::length_error("Variable-length value too large");
                    }
                    body.push_back(255);
                    utils::append_be(body, value.size(), 2);
                }
            } else if (i < layout.size() && layout[i].length != value.size()) {
                throw std::invalid_argument("Value " + std::to_string(i) + " has " +
                                            std::to_string(value.size()) +
                                            " bytes, template declares " +
                                            std::to_string(layout[i].length));
            }

            body.insert(body.end(), value.begin(), value.end());
        }
    }

    append_set(template_id, body, records.size());
    return *this;
}

PacketBuilder& PacketBuilder::add_raw_set(uint16_t set_id, const std::vector<uint8_t>& body) {
    append_set(set_id, body, 0);
    return *this;
}

std::vector<uint8_t> PacketBuilder::build() const {
    size_t total = version_ == ProtocolVersion::IPFIX ? IPFIX_HEADER_LENGTH
                                                      : NETFLOW_V9_HEADER_LENGTH;
    for (const auto& set : sets_) {
        total += set.size();
    }

    std::vector<uint8_t> packet;
    packet.reserve(total);
    utils::append_be(packet, static_cast<uint16_t>(version_), 2);

    if (version_ == ProtocolVersion::IPFIX) {
        if (total > 0xFFFF) {
            throw std::length_error("IPFIX message too large: " + std::to_string(total));
        }
        utils::append_be(packet, total, 2);
        utils::append_be(packet, unix_secs_, 4);
        utils::append_be(packet, sequence_, 4);
        utils::append_be(packet, domain_id_, 4);
    } else {
        utils::append_be(packet, record_count_, 2);
        utils::append_be(packet, sys_uptime_ms_, 4);
        utils::append_be(packet, unix_secs_, 4);
        utils::append_be(packet, sequence_, 4);
        utils::append_be(packet, domain_id_, 4);
    }

    for (const auto& set : sets_) {
        packet.insert(packet.end(), set.begin(), set.end());
    }
    return packet;
}

PacketBuilder::Bytes PacketBuilder::encode_uint(uint64_t value, size_t length) {
    if (length == 0 || length > 8) {
        throw std::invalid_argument("Integer length must be 1..8, got " + std::to_string(length));
    }
    Bytes bytes;
    utils::append_be(bytes, value, length);
    return bytes;
}

PacketBuilder::Bytes PacketBuilder::encode_ipv4(const std::string& address) {
    return encode_uint(utils::ip_str_to_uint32(address), 4);
}

PacketBuilder::Bytes PacketBuilder::encode_ipv6(const std::string& address) {
    auto bytes = utils::ipv6_str_to_bytes(address);
    return Bytes(bytes.begin(), bytes.end());
}

PacketBuilder::Bytes PacketBuilder::encode_text(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace nfcollect
