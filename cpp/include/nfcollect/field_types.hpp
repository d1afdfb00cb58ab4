#ifndef NFCOLLECT_FIELD_TYPES_HPP
#define NFCOLLECT_FIELD_TYPES_HPP

#include <cstdint>
#include <string>

namespace nfcollect {

/**
 * Export protocol, named after the version word of the packet header
 */
enum class ProtocolVersion : uint16_t {
    NETFLOW_V9 = 9,
    IPFIX = 10
};

/**
 * How the bytes of a field are interpreted during normalization
 */
enum class FieldKind {
    UNSIGNED,
    IPV4_ADDRESS,
    IPV6_ADDRESS,
    MAC_ADDRESS,
    TEXT,
    BYTES
};

/**
 * Entry of the field-type code table
 */
struct FieldInfo {
    uint16_t id;
    const char* name;
    FieldKind kind;
};

// IPFIX field length announcing a variable-length encoded value (RFC 7011 7.)
constexpr uint16_t VARIABLE_LENGTH = 65535;

// Field-type codes the collector interprets itself
namespace field_id {
constexpr uint16_t IN_BYTES = 1;
constexpr uint16_t IN_PKTS = 2;
constexpr uint16_t PROTOCOL = 4;
constexpr uint16_t L4_SRC_PORT = 7;
constexpr uint16_t IPV4_SRC_ADDR = 8;
constexpr uint16_t L4_DST_PORT = 11;
constexpr uint16_t IPV4_DST_ADDR = 12;
constexpr uint16_t LAST_SWITCHED = 21;
constexpr uint16_t FIRST_SWITCHED = 22;
constexpr uint16_t IPV6_SRC_ADDR = 27;
constexpr uint16_t IPV6_DST_ADDR = 28;
constexpr uint16_t IP_PROTOCOL_VERSION = 60;
constexpr uint16_t FLOW_START_MILLISECONDS = 152;
constexpr uint16_t FLOW_END_MILLISECONDS = 153;
} // namespace field_id

/**
 * Look up a field-type code
 *
 * NetFlow v9 codes follow RFC 3954 plus the Cisco ASA (NF_F_*) and PAN-OS
 * extensions. IPFIX information elements 1-127 share the v9 names; the
 * higher elements the collector knows are named after their IANA names in
 * upper snake case.
 *
 * @return nullptr for unknown codes
 */
const FieldInfo* lookup_field(ProtocolVersion version, uint16_t id);

/**
 * Canonical flow-record key for a field
 *
 * Unknown codes map to "FIELD_<id>", enterprise-specific IPFIX elements to
 * "FIELD_<enterprise>_<id>".
 */
std::string field_name(ProtocolVersion version, uint16_t id, uint32_t enterprise_number = 0);

/**
 * Interpretation of a field, UNSIGNED for unknown codes
 */
FieldKind field_kind(ProtocolVersion version, uint16_t id, uint32_t enterprise_number = 0);

std::string protocol_version_name(ProtocolVersion version);

} // namespace nfcollect

#endif // NFCOLLECT_FIELD_TYPES_HPP
