#ifndef NFCOLLECT_PACKET_BUILDER_HPP
#define NFCOLLECT_PACKET_BUILDER_HPP

#include "template_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace nfcollect {

/**
 * Encoder for NetFlow v9 and IPFIX export packets
 *
 * Produces byte-exact datagrams from templates and field values. Used to
 * feed the decoder with synthetic traffic (tests, examples, Python
 * bindings).
 *
 * Example:
 *   PacketBuilder builder(ProtocolVersion::NETFLOW_V9, 1700000000, 1);
 *   builder.add_template(256, {{8, 4}, {12, 4}, {1, 4}});
 *   builder.add_data_set(256, {{PacketBuilder::encode_ipv4("10.0.0.1"),
 *                               PacketBuilder::encode_ipv4("10.0.0.2"),
 *                               PacketBuilder::encode_uint(1500, 4)}});
 *   std::vector<uint8_t> datagram = builder.build();
 */
class PacketBuilder {
public:
    using Bytes = std::vector<uint8_t>;
    using Record = std::vector<Bytes>;

    PacketBuilder(ProtocolVersion version, uint32_t unix_secs, uint32_t sequence,
                  uint32_t domain_id = 0, uint32_t sys_uptime_ms = 0);

    /**
     * Append a template set carrying one template record
     */
    PacketBuilder& add_template(uint16_t template_id, const std::vector<FieldSpec>& fields);

    /**
     * Append an options template set
     *
     * @param scope_fields Leading scope fields
     * @param option_fields Option fields following the scope
     */
    PacketBuilder& add_options_template(uint16_t template_id,
                                        const std::vector<FieldSpec>& scope_fields,
                                        const std::vector<FieldSpec>& option_fields);

    /**
     * Append an IPFIX template withdrawal (field count 0)
     *
     * Passing the template set ID (2) withdraws all templates.
     */
    PacketBuilder& add_template_withdrawal(uint16_t template_id);

    /**
     * Append a data set
     *
     * Values are written in template order. A value for an IPFIX
     * variable-length field gets its length prefix here; fixed-length values
     * must already have the template's length.
     *
     * @param layout Template the records follow, used for variable-length
     *               prefixes; may be empty when all fields are fixed-length
     */
    PacketBuilder& add_data_set(uint16_t template_id, const std::vector<Record>& records,
                                const std::vector<FieldSpec>& layout = {});

    /**
     * Append a set with an arbitrary ID and body, padding included
     */
    PacketBuilder& add_raw_set(uint16_t set_id, const std::vector<uint8_t>& body);

    /**
     * Serialize header plus sets
     */
    std::vector<uint8_t> build() const;

    size_t set_count() const { return sets_.size(); }

    static Bytes encode_uint(uint64_t value, size_t length);
    static Bytes encode_ipv4(const std::string& address);
    static Bytes encode_ipv6(const std::string& address);
    static Bytes encode_text(const std::string& text);

private:
    void append_field_spec(std::vector<uint8_t>& out, const FieldSpec& spec) const;
    void append_set(uint16_t set_id, const std::vector<uint8_t>& body, size_t records);

    ProtocolVersion version_;
    uint32_t unix_secs_;
    uint32_t sequence_;
    uint32_t domain_id_;
    uint32_t sys_uptime_ms_;

    std::vector<std::vector<uint8_t>> sets_;
    size_t record_count_;  // v9 header count: template plus data records
};

} // namespace nfcollect

#endif // NFCOLLECT_PACKET_BUILDER_HPP
