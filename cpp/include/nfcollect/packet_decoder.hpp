#ifndef NFCOLLECT_PACKET_DECODER_HPP
#define NFCOLLECT_PACKET_DECODER_HPP

#include "template_store.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace nfcollect {

/**
 * Malformed or truncated datagram; the caller drops the datagram
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Set IDs (RFC 3954 5.2 / RFC 7011 3.3.2)
constexpr uint16_t NETFLOW_V9_TEMPLATE_SET_ID = 0;
constexpr uint16_t NETFLOW_V9_OPTIONS_TEMPLATE_SET_ID = 1;
constexpr uint16_t IPFIX_TEMPLATE_SET_ID = 2;
constexpr uint16_t IPFIX_OPTIONS_TEMPLATE_SET_ID = 3;
constexpr uint16_t MIN_DATA_SET_ID = 256;

constexpr size_t NETFLOW_V9_HEADER_LENGTH = 20;
constexpr size_t IPFIX_HEADER_LENGTH = 16;
constexpr size_t SET_HEADER_LENGTH = 4;

/**
 * Packet header, common view of the v9 and IPFIX layouts
 *
 * NetFlow v9: version, count, sys_uptime, unix_secs, sequence, source_id.
 * IPFIX: version, length, export_time, sequence, observation_domain_id.
 */
struct PacketHeader {
    uint16_t version = 0;
    uint16_t count = 0;          // v9: records in the packet
    uint16_t length = 0;         // IPFIX: message length in octets
    uint32_t sys_uptime_ms = 0;  // v9 only
    uint32_t unix_secs = 0;
    uint32_t sequence = 0;
    uint32_t source_id = 0;

    ProtocolVersion protocol() const { return static_cast<ProtocolVersion>(version); }
};

/**
 * Raw value of one field, sliced out of a data record
 */
struct RawField {
    FieldSpec spec;
    std::vector<uint8_t> value;
};

/**
 * Data record decoded with its template
 */
struct DataRecord {
    uint16_t template_id = 0;
    TemplateKind kind = TemplateKind::DATA;
    std::vector<RawField> fields;
};

struct DecodedPacket {
    PacketHeader header;
    Exporter exporter;
    std::vector<DataRecord> records;

    size_t templates_learned = 0;
    size_t templates_withdrawn = 0;
    size_t templates_rejected = 0;
    size_t unknown_template_sets = 0;
    size_t skipped_sets = 0;

    // Template IDs referenced by data sets before they were announced
    std::vector<uint16_t> missing_templates;

    size_t data_record_count() const;
    size_t options_record_count() const;
};

/**
 * NetFlow v9 / IPFIX packet decoder
 *
 * Template and options template sets update the template store; data sets
 * are decoded with the exporter's current templates. A data set whose
 * template is not known yet is skipped and decoding continues with the
 * next set, since exporters may send data before the collector has seen a
 * (possibly lost) template packet.
 */
class PacketDecoder {
public:
    explicit PacketDecoder(TemplateStore& store);

    /**
     * Decode one UDP datagram
     *
     * @param data Datagram payload
     * @param length Payload length
     * @param exporter_address Source address of the datagram
     * @throws DecodeError if the datagram is malformed
     */
    DecodedPacket decode(const uint8_t* data, size_t length,
                         const std::string& exporter_address,
                         TemplateStore::Clock::time_point now = TemplateStore::Clock::now());

    DecodedPacket decode(const std::vector<uint8_t>& datagram,
                         const std::string& exporter_address,
                         TemplateStore::Clock::time_point now = TemplateStore::Clock::now());

    /**
     * Read only the packet header
     *
     * @throws DecodeError on short input or unsupported version
     */
    static PacketHeader parse_header(const uint8_t* data, size_t length);

private:
    TemplateStore& store_;
};

} // namespace nfcollect

#endif // NFCOLLECT_PACKET_DECODER_HPP
