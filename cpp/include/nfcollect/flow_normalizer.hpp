#ifndef NFCOLLECT_FLOW_NORMALIZER_HPP
#define NFCOLLECT_FLOW_NORMALIZER_HPP

#include "flow_record.hpp"
#include "packet_decoder.hpp"
#include <cstdint>
#include <vector>

namespace nfcollect {

/**
 * Turns decoded data records into canonical flow records
 *
 * Values are interpreted by field kind:
 *   - 4-byte IPv4 and 16-byte IPv6 address fields as address strings
 *   - 6-byte MAC fields as "aa:bb:cc:dd:ee:ff"
 *   - text fields (interface, sampler, application names) as strings,
 *     trailing NUL padding removed
 *   - everything else of 1..8 bytes as a big-endian unsigned integer, so
 *     reduced-size encodings decode to the same value
 *   - longer values as lower-case hex
 * A value whose length does not fit its kind falls back to integer or hex.
 */
class FlowNormalizer {
public:
    struct Stats {
        uint64_t flows = 0;
        uint64_t options_records = 0;
    };

    FlowNormalizer() = default;

    /**
     * Normalize one data record
     */
    FlowRecord normalize(const DataRecord& record, ProtocolVersion version) const;

    /**
     * Normalize the data records of a packet
     *
     * Options records describe the exporter, not traffic; they are counted
     * and left out.
     */
    std::vector<FlowRecord> normalize(const DecodedPacket& packet);

    static FieldValue decode_value(const FieldSpec& spec, const std::vector<uint8_t>& bytes,
                                   ProtocolVersion version);

    const Stats& stats() const { return stats_; }

private:
    Stats stats_;
};

} // namespace nfcollect

#endif // NFCOLLECT_FLOW_NORMALIZER_HPP
