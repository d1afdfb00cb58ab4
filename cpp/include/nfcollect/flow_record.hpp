#ifndef NFCOLLECT_FLOW_RECORD_HPP
#define NFCOLLECT_FLOW_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nfcollect {

// Flow-record keys the aggregation and report steps read
namespace flow_key {
constexpr const char* IN_BYTES = "IN_BYTES";
constexpr const char* IN_PKTS = "IN_PKTS";
constexpr const char* PROTOCOL = "PROTOCOL";
constexpr const char* L4_SRC_PORT = "L4_SRC_PORT";
constexpr const char* L4_DST_PORT = "L4_DST_PORT";
constexpr const char* IPV4_SRC_ADDR = "IPV4_SRC_ADDR";
constexpr const char* IPV4_DST_ADDR = "IPV4_DST_ADDR";
constexpr const char* IPV6_SRC_ADDR = "IPV6_SRC_ADDR";
constexpr const char* IPV6_DST_ADDR = "IPV6_DST_ADDR";
constexpr const char* FIRST_SWITCHED = "FIRST_SWITCHED";
constexpr const char* LAST_SWITCHED = "LAST_SWITCHED";
constexpr const char* IP_PROTOCOL_VERSION = "IP_PROTOCOL_VERSION";
constexpr const char* FLOW_START_MILLISECONDS = "FLOW_START_MILLISECONDS";
constexpr const char* FLOW_END_MILLISECONDS = "FLOW_END_MILLISECONDS";
} // namespace flow_key

/**
 * Typed value of a flow-record field
 */
struct FieldValue {
    enum class Kind {
        UNSIGNED,
        ADDRESS,   // IPv4 or IPv6 in text form
        MAC,
        TEXT,
        BYTES      // lower-case hex
    };

    Kind kind = Kind::UNSIGNED;
    uint64_t number = 0;
    std::string text;

    static FieldValue from_uint(uint64_t value);
    static FieldValue from_address(const std::string& address);
    static FieldValue from_mac(const std::string& mac);
    static FieldValue from_text(const std::string& value);
    static FieldValue from_hex(const std::string& hex);

    bool is_number() const { return kind == Kind::UNSIGNED; }

    /**
     * Decimal for integers, the stored text otherwise
     */
    std::string to_string() const;
};

bool operator==(const FieldValue& lhs, const FieldValue& rhs);
bool operator!=(const FieldValue& lhs, const FieldValue& rhs);

/**
 * Canonical flow record
 *
 * Ordered mapping from upper-case field name (IN_BYTES, IPV4_SRC_ADDR, ...)
 * to a typed value. Field order follows the template the record was decoded
 * with.
 */
class FlowRecord {
public:
    using Field = std::pair<std::string, FieldValue>;

    FlowRecord() = default;

    /**
     * Set a field, replacing the value of an existing name in place
     */
    void set(const std::string& name, FieldValue value);

    bool has(const std::string& name) const;

    /**
     * @return nullptr when the field is absent
     */
    const FieldValue* find(const std::string& name) const;

    /**
     * Integer value of a field, empty when absent or not an integer
     */
    std::optional<uint64_t> get_uint(const std::string& name) const;

    /**
     * Text form of a field, empty when absent
     */
    std::optional<std::string> get_text(const std::string& name) const;

    /**
     * IP version of the flow: 4 if IP_PROTOCOL_VERSION is 4 or an IPv4
     * address field is present, 6 otherwise
     */
    int ip_version() const;

    // Addresses of the flow's IP version, empty when the field is missing
    std::string source_address() const;
    std::string destination_address() const;

    uint16_t source_port() const;
    uint16_t destination_port() const;
    uint8_t protocol() const;

    const std::vector<Field>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

private:
    std::vector<Field> fields_;
};

bool operator==(const FlowRecord& lhs, const FlowRecord& rhs);

} // namespace nfcollect

#endif // NFCOLLECT_FLOW_RECORD_HPP
