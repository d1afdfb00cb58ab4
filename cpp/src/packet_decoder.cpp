#include "nfcollect/packet_decoder.hpp"
#include "nfcollect/logging.hpp"
#include "nfcollect/utils.hpp"

#include <algorithm>

namespace nfcollect {

namespace {

// Bounds-checked cursor over a byte span
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t length)
        : data_(data), length_(length), offset_(0) {}

    size_t remaining() const { return length_ - offset_; }
    size_t offset() const { return offset_; }
    const uint8_t* current() const { return data_ + offset_; }

    uint8_t read_u8(const char* what) {
        require(1, what);
        return data_[offset_++];
    }

    uint16_t read_u16(const char* what) {
        require(2, what);
        uint16_t value = utils::read_be16(data_ + offset_);
        offset_ += 2;
        return value;
    }

    uint32_t read_u32(const char* what) {
        require(4, what);
        uint32_t value = utils::read_be32(data_ + offset_);
        offset_ += 4;
        return value;
    }

    std::vector<uint8_t> read_bytes(size_t count, const char* what) {
        require(count, what);
        std::vector<uint8_t> bytes(data_ + offset_, data_ + offset_ + count);
        offset_ += count;
        return bytes;
    }

    ByteReader sub_reader(size_t count, const char* what) {
        require(count, what);
        ByteReader sub(data_ + offset_, count);
        offset_ += count;
        return sub;
    }

    void skip(size_t count, const char* what) {
        require(count, what);
        offset_ += count;
    }

private:
    void require(size_t count, const char* what) const {
        if (count > remaining()) {
            throw DecodeError(std::string("Truncated ") + what + ": need " +
                              std::to_string(count) + " bytes, " +
                              std::to_string(remaining()) + " left");
        }
    }

    const uint8_t* data_;
    size_t length_;
    size_t offset_;
};

// Decoding context of one datagram
class SetDecoder {
public:
    SetDecoder(TemplateStore& store, DecodedPacket& packet, TemplateStore::Clock::time_point now)
        : store_(store), packet_(packet), now_(now),
          version_(packet.header.protocol()) {}

    void decode_set(uint16_t set_id, ByteReader body) {
        if (is_template_set(set_id)) {
            decode_template_set(body);
        } else if (is_options_template_set(set_id)) {
            decode_options_template_set(body);
        } else if (set_id >= MIN_DATA_SET_ID) {
            decode_data_set(set_id, body);
        } else {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Skipping reserved set ID {} from {}",
                                set_id, packet_.exporter.to_string());
            packet_.skipped_sets++;
        }
    }

private:
    bool is_ipfix() const { return version_ == ProtocolVersion::IPFIX; }

    bool is_template_set(uint16_t set_id) const {
        return set_id == (is_ipfix() ? IPFIX_TEMPLATE_SET_ID : NETFLOW_V9_TEMPLATE_SET_ID);
    }

    bool is_options_template_set(uint16_t set_id) const {
        return set_id == (is_ipfix() ? IPFIX_OPTIONS_TEMPLATE_SET_ID
                                     : NETFLOW_V9_OPTIONS_TEMPLATE_SET_ID);
    }

    FieldSpec read_field_spec(ByteReader& reader) {
        FieldSpec spec;
        spec.type = reader.read_u16("field specifier");
        spec.length = reader.read_u16("field specifier");

        // IPFIX: enterprise bit set, a Private Enterprise Number follows
        if (is_ipfix() && (spec.type & 0x8000) != 0) {
            spec.type &= 0x7FFF;
            spec.enterprise_number = reader.read_u32("enterprise number");
        }
        return spec;
    }

    void store_template(Template tmpl) {
        if (tmpl.template_id < MIN_DATA_SET_ID) {
            SPDLOG_LOGGER_WARN(Logger::instance(), "Ignoring template with reserved ID {} from {}",
                               tmpl.template_id, packet_.exporter.to_string());
            packet_.templates_rejected++;
            return;
        }

        // A zero-length record would never advance the data set cursor
        if (tmpl.min_record_length() == 0) {
            SPDLOG_LOGGER_WARN(Logger::instance(), "Ignoring template {} from {}: empty record layout",
                               tmpl.template_id, packet_.exporter.to_string());
            packet_.templates_rejected++;
            return;
        }

        if (!is_ipfix()) {
            for (const auto& field : tmpl.fields) {
                if (field.length == 0) {
                    SPDLOG_LOGGER_WARN(Logger::instance(),
                                       "Ignoring template {} from {}: zero-length field {}",
                                       tmpl.template_id, packet_.exporter.to_string(), field.type);
                    packet_.templates_rejected++;
                    return;
                }
            }
        }

        uint16_t template_id = tmpl.template_id;
        store_.put(packet_.exporter, template_id, std::move(tmpl), now_);
        packet_.templates_learned++;
    }

    void withdraw_template(uint16_t template_id, uint16_t set_id) {
        // Withdrawal with the set ID as template ID withdraws everything
        if (template_id == set_id) {
            size_t removed = store_.remove(packet_.exporter);
            packet_.templates_withdrawn += removed;
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "All {} templates of {} withdrawn",
                                removed, packet_.exporter.to_string());
            return;
        }

        if (store_.remove(packet_.exporter, template_id)) {
            packet_.templates_withdrawn++;
        }
    }

    void decode_template_set(ByteReader& body) {
        const uint16_t set_id = is_ipfix() ? IPFIX_TEMPLATE_SET_ID : NETFLOW_V9_TEMPLATE_SET_ID;

        // Anything shorter than a template record header is padding
        while (body.remaining() >= 4) {
            Template tmpl;
            tmpl.kind = TemplateKind::DATA;
            tmpl.version = version_;
            tmpl.template_id = body.read_u16("template record header");
            uint16_t field_count = body.read_u16("template record header");

            if (field_count == 0) {
                if (is_ipfix()) {
                    withdraw_template(tmpl.template_id, set_id);
                }
                continue;
            }

            tmpl.fields.reserve(field_count);
            for (uint16_t i = 0; i < field_count; ++i) {
                tmpl.fields.push_back(read_field_spec(body));
            }
            store_template(std::move(tmpl));
        }
    }

    void decode_options_template_set(ByteReader& body) {
        if (is_ipfix()) {
            decode_ipfix_options_templates(body);
        } else {
            decode_netflow_v9_options_templates(body);
        }
    }

    // RFC 3954 6.1: scope and option lengths are given in octets
    void decode_netflow_v9_options_templates(ByteReader& body) {
        while (body.remaining() >= 6) {
            Template tmpl;
            tmpl.kind = TemplateKind::OPTIONS;
            tmpl.version = version_;
            tmpl.template_id = body.read_u16("options template header");
            uint16_t scope_length = body.read_u16("options template header");
            uint16_t option_length = body.read_u16("options template header");

            if (scope_length % 4 != 0 || option_length % 4 != 0) {
                throw DecodeError("Options template " + std::to_string(tmpl.template_id) +
                                  " has field lengths that are not a multiple of 4");
            }

            tmpl.scope_field_count = scope_length / 4;
            size_t field_count = (scope_length + option_length) / 4;
            for (size_t i = 0; i < field_count; ++i) {
                tmpl.fields.push_back(read_field_spec(body));
            }
            store_template(std::move(tmpl));
        }
    }

    // RFC 7011 3.4.2.2
    void decode_ipfix_options_templates(ByteReader& body) {
        while (body.remaining() >= 4) {
            Template tmpl;
            tmpl.kind = TemplateKind::OPTIONS;
            tmpl.version = version_;
            tmpl.template_id = body.read_u16("options template header");
            uint16_t field_count = body.read_u16("options template header");

            if (field_count == 0) {
                withdraw_template(tmpl.template_id, IPFIX_OPTIONS_TEMPLATE_SET_ID);
                continue;
            }

            tmpl.scope_field_count = body.read_u16("options template header");
            if (tmpl.scope_field_count == 0 || tmpl.scope_field_count > field_count) {
                throw DecodeError("Options template " + std::to_string(tmpl.template_id) +
                                  " has an invalid scope field count");
            }

            for (uint16_t i = 0; i < field_count; ++i) {
                tmpl.fields.push_back(read_field_spec(body));
            }
            store_template(std::move(tmpl));
        }
    }

    void decode_data_set(uint16_t set_id, ByteReader& body) {
        const Template* tmpl = store_.get(packet_.exporter, set_id, now_);
        if (tmpl == nullptr) {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "No template {} for {}, skipping {} bytes of data",
                                set_id, packet_.exporter.to_string(), body.remaining());
            packet_.unknown_template_sets++;
            packet_.missing_templates.push_back(set_id);
            return;
        }

        const size_t min_length = tmpl->min_record_length();
        const bool variable = is_ipfix() && tmpl->has_variable_length_fields();
        size_t last_length = 0;

        // Trailing bytes shorter than a record are padding
        while (body.remaining() > 0 && body.remaining() >= min_length) {
            // Variable-length records: zero bytes shorter than the previous
            // record are padding too
            if (variable && body.remaining() < last_length && all_zero(body)) {
                break;
            }

            const size_t start = body.offset();
            DataRecord record;
            record.template_id = set_id;
            record.kind = tmpl->kind;
            record.fields.reserve(tmpl->fields.size());

            for (const auto& spec : tmpl->fields) {
                RawField field;
                field.spec = spec;

                size_t length = spec.length;
                if (is_ipfix() && spec.is_variable_length()) {
                    length = body.read_u8("variable-length field");
                    if (length == 255) {
                        length = body.read_u16("variable-length field");
                    }
                }

                field.value = body.read_bytes(length, "data record");
                record.fields.push_back(std::move(field));
            }

            packet_.records.push_back(std::move(record));
            last_length = body.offset() - start;
        }
    }

    static bool all_zero(const ByteReader& body) {
        const uint8_t* data = body.current();
        return std::all_of(data, data + body.remaining(), [](uint8_t b) { return b == 0; });
    }

    TemplateStore& store_;
    DecodedPacket& packet_;
    TemplateStore::Clock::time_point now_;
    ProtocolVersion version_;
};

} // namespace

size_t DecodedPacket::data_record_count() const {
    size_t count = 0;
    for (const auto& record : records) {
        if (record.kind == TemplateKind::DATA) {
            count++;
        }
    }
    return count;
}

size_t DecodedPacket::options_record_count() const {
    return records.size() - data_record_count();
}

PacketDecoder::PacketDecoder(TemplateStore& store)
    : store_(store) {
}

PacketHeader PacketDecoder::parse_header(const uint8_t* data, size_t length) {
    ByteReader reader(data, length);
    PacketHeader header;
    header.version = reader.read_u16("packet header");

    if (header.version == static_cast<uint16_t>(ProtocolVersion::NETFLOW_V9)) {
        header.count = reader.read_u16("NetFlow v9 header");
        header.sys_uptime_ms = reader.read_u32("NetFlow v9 header");
        header.unix_secs = reader.read_u32("NetFlow v9 header");
        header.sequence = reader.read_u32("NetFlow v9 header");
        header.source_id = reader.read_u32("NetFlow v9 header");
        header.length = static_cast<uint16_t>(length > 0xFFFF ? 0xFFFF : length);
    } else if (header.version == static_cast<uint16_t>(ProtocolVersion::IPFIX)) {
        header.length = reader.read_u16("IPFIX header");
        header.unix_secs = reader.read_u32("IPFIX header");
        header.sequence = reader.read_u32("IPFIX header");
        header.source_id = reader.read_u32("IPFIX header");

        if (header.length < IPFIX_HEADER_LENGTH) {
            throw DecodeError("IPFIX message length " + std::to_string(header.length) +
                              " is shorter than its header");
        }
        if (header.length > length) {
            throw DecodeError("IPFIX message length " + std::to_string(header.length) +
                              " exceeds datagram size " + std::to_string(length));
        }
    } else {
        throw DecodeError("Unsupported export version " + std::to_string(header.version));
    }

    return header;
}

DecodedPacket PacketDecoder::decode(const uint8_t* data, size_t length,
                                    const std::string& exporter_address,
                                    TemplateStore::Clock::time_point now) {
    DecodedPacket packet;
    packet.header = parse_header(data, length);
    packet.exporter.address = exporter_address;
    packet.exporter.domain_id = packet.header.source_id;

    size_t header_length = NETFLOW_V9_HEADER_LENGTH;
    size_t message_length = length;
    if (packet.header.protocol() == ProtocolVersion::IPFIX) {
        header_length = IPFIX_HEADER_LENGTH;
        message_length = packet.header.length;
    }

    ByteReader reader(data, message_length);
    reader.skip(header_length, "packet header");

    SetDecoder sets(store_, packet, now);

    // v9 exporters may pad the packet; IPFIX sets always fill the message
    while (reader.remaining() >= SET_HEADER_LENGTH) {
        uint16_t set_id = reader.read_u16("set header");
        uint16_t set_length = reader.read_u16("set header");

        if (set_length < SET_HEADER_LENGTH) {
            throw DecodeError("Set " + std::to_string(set_id) + " declares length " +
                              std::to_string(set_length) + ", shorter than its header");
        }

        size_t body_length = set_length - SET_HEADER_LENGTH;
        if (body_length > reader.remaining()) {
            throw DecodeError("Set " + std::to_string(set_id) + " declares length " +
                              std::to_string(set_length) + ", only " +
                              std::to_string(reader.remaining() + SET_HEADER_LENGTH) +
                              " bytes left in the packet");
        }

        sets.decode_set(set_id, reader.sub_reader(body_length, "set body"));
    }

    if (packet.header.protocol() == ProtocolVersion::IPFIX && reader.remaining() > 0) {
        throw DecodeError("IPFIX message has " + std::to_string(reader.remaining()) +
                          " trailing bytes after the last set");
    }

    return packet;
}

DecodedPacket PacketDecoder::decode(const std::vector<uint8_t>& datagram,
                                    const std::string& exporter_address,
                                    TemplateStore::Clock::time_point now) {
    return decode(datagram.data(), datagram.size(), exporter_address, now);
}

} // namespace nfcollect
