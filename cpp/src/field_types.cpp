#include "nfcollect/field_types.hpp"
#include <unordered_map>

namespace nfcollect {

namespace {

constexpr FieldKind U = FieldKind::UNSIGNED;
constexpr FieldKind V4 = FieldKind::IPV4_ADDRESS;
constexpr FieldKind V6 = FieldKind::IPV6_ADDRESS;
constexpr FieldKind MAC = FieldKind::MAC_ADDRESS;
constexpr FieldKind TXT = FieldKind::TEXT;
constexpr FieldKind RAW = FieldKind::BYTES;

// RFC 3954 section 8, vendor extensions at the end
const FieldInfo NETFLOW_V9_FIELDS[] = {
    {1, "IN_BYTES", U},
    {2, "IN_PKTS", U},
    {3, "FLOWS", U},
    {4, "PROTOCOL", U},
    {5, "SRC_TOS", U},
    {6, "TCP_FLAGS", U},
    {7, "L4_SRC_PORT", U},
    {8, "IPV4_SRC_ADDR", V4},
    {9, "SRC_MASK", U},
    {10, "INPUT_SNMP", U},
    {11, "L4_DST_PORT", U},
    {12, "IPV4_DST_ADDR", V4},
    {13, "DST_MASK", U},
    {14, "OUTPUT_SNMP", U},
    {15, "IPV4_NEXT_HOP", V4},
    {16, "SRC_AS", U},
    {17, "DST_AS", U},
    {18, "BGP_IPV4_NEXT_HOP", V4},
    {19, "MUL_DST_PKTS", U},
    {20, "MUL_DST_BYTES", U},
    {21, "LAST_SWITCHED", U},
    {22, "FIRST_SWITCHED", U},
    {23, "OUT_BYTES", U},
    {24, "OUT_PKTS", U},
    {25, "MIN_PKT_LNGTH", U},
    {26, "MAX_PKT_LNGTH", U},
    {27, "IPV6_SRC_ADDR", V6},
    {28, "IPV6_DST_ADDR", V6},
    {29, "IPV6_SRC_MASK", U},
    {30, "IPV6_DST_MASK", U},
    {31, "IPV6_FLOW_LABEL", U},
    {32, "ICMP_TYPE", U},
    {33, "MUL_IGMP_TYPE", U},
    {34, "SAMPLING_INTERVAL", U},
    {35, "SAMPLING_ALGORITHM", U},
    {36, "FLOW_ACTIVE_TIMEOUT", U},
    {37, "FLOW_INACTIVE_TIMEOUT", U},
    {38, "ENGINE_TYPE", U},
    {39, "ENGINE_ID", U},
    {40, "TOTAL_BYTES_EXP", U},
    {41, "TOTAL_PKTS_EXP", U},
    {42, "TOTAL_FLOWS_EXP", U},
    {44, "IPV4_SRC_PREFIX", V4},
    {45, "IPV4_DST_PREFIX", V4},
    {46, "MPLS_TOP_LABEL_TYPE", U},
    {47, "MPLS_TOP_LABEL_IP_ADDR", V4},
    {48, "FLOW_SAMPLER_ID", U},
    {49, "FLOW_SAMPLER_MODE", U},
    {50, "FLOW_SAMPLER_RANDOM_INTERVAL", U},
    {52, "MIN_TTL", U},
    {53, "MAX_TTL", U},
    {54, "IPV4_IDENT", U},
    {55, "DST_TOS", U},
    {56, "IN_SRC_MAC", MAC},
    {57, "OUT_DST_MAC", MAC},
    {58, "SRC_VLAN", U},
    {59, "DST_VLAN", U},
    {60, "IP_PROTOCOL_VERSION", U},
    {61, "DIRECTION", U},
    {62, "IPV6_NEXT_HOP", V6},
    {63, "BPG_IPV6_NEXT_HOP", V6},
    {64, "IPV6_OPTION_HEADERS", U},
    {70, "MPLS_LABEL_1", U},
    {71, "MPLS_LABEL_2", U},
    {72, "MPLS_LABEL_3", U},
    {73, "MPLS_LABEL_4", U},
    {74, "MPLS_LABEL_5", U},
    {75, "MPLS_LABEL_6", U},
    {76, "MPLS_LABEL_7", U},
    {77, "MPLS_LABEL_8", U},
    {78, "MPLS_LABEL_9", U},
    {79, "MPLS_LABEL_10", U},
    {80, "IN_DST_MAC", MAC},
    {81, "OUT_SRC_MAC", MAC},
    {82, "IF_NAME", TXT},
    {83, "IF_DESC", TXT},
    {84, "SAMPLER_NAME", TXT},
    {85, "IN_PERMANENT_BYTES", U},
    {86, "IN_PERMANENT_PKTS", U},
    {88, "FRAGMENT_OFFSET", U},
    {89, "FORWARDING_STATUS", U},
    {90, "MPLS_PAL_RD", RAW},
    {91, "MPLS_PREFIX_LEN", U},
    {92, "SRC_TRAFFIC_INDEX", U},
    {93, "DST_TRAFFIC_INDEX", U},
    {94, "APPLICATION_DESCRIPTION", TXT},
    {95, "APPLICATION_TAG", RAW},
    {96, "APPLICATION_NAME", TXT},
    {98, "postipDiffServCodePoint", U},
    {99, "replication factor", U},
    {100, "DEPRECATED", RAW},
    {102, "layer2packetSectionOffset", U},
    {103, "layer2packetSectionSize", U},
    {104, "layer2packetSectionData", RAW},

    // Cisco ASA
    {148, "NF_F_CONN_ID", U},
    {152, "NF_F_FLOW_CREATE_TIME_MSEC", U},
    {176, "NF_F_ICMP_TYPE", U},
    {177, "NF_F_ICMP_CODE", U},
    {178, "NF_F_ICMP_TYPE_IPV6", U},
    {179, "NF_F_ICMP_CODE_IPV6", U},
    {225, "NF_F_XLATE_SRC_ADDR_IPV4", V4},
    {226, "NF_F_XLATE_DST_ADDR_IPV4", V4},
    {227, "NF_F_XLATE_SRC_PORT", U},
    {228, "NF_F_XLATE_DST_PORT", U},
    {231, "NF_F_FWD_FLOW_DELTA_BYTES", U},
    {232, "NF_F_REV_FLOW_DELTA_BYTES", U},
    {233, "NF_F_FW_EVENT", U},
    {281, "NF_F_XLATE_SRC_ADDR_IPV6", V6},
    {282, "NF_F_XLATE_DST_ADDR_IPV6", V6},
    {323, "NF_F_EVENT_TIME_MSEC", U},
    {33000, "NF_F_INGRESS_ACL_ID", RAW},
    {33001, "NF_F_EGRESS_ACL_ID", RAW},
    {33002, "NF_F_FW_EXT_EVENT", U},
    {40000, "NF_F_USERNAME", TXT},

    // PAN-OS
    {346, "PANOS_privateEnterpriseNumber", U},
    {56701, "PANOS_APPID", TXT},
    {56702, "PANOS_USERID", TXT},
};

// IANA IPFIX information elements above the v9 range
const FieldInfo IPFIX_FIELDS[] = {
    {128, "BGP_NEXT_ADJACENT_AS_NUMBER", U},
    {129, "BGP_PREV_ADJACENT_AS_NUMBER", U},
    {130, "EXPORTER_IPV4_ADDRESS", V4},
    {131, "EXPORTER_IPV6_ADDRESS", V6},
    {132, "DROPPED_OCTET_DELTA_COUNT", U},
    {133, "DROPPED_PACKET_DELTA_COUNT", U},
    {134, "DROPPED_OCTET_TOTAL_COUNT", U},
    {135, "DROPPED_PACKET_TOTAL_COUNT", U},
    {136, "FLOW_END_REASON", U},
    {137, "COMMON_PROPERTIES_ID", U},
    {138, "OBSERVATION_POINT_ID", U},
    {139, "ICMP_TYPE_CODE_IPV6", U},
    {140, "MPLS_TOP_LABEL_IPV6_ADDRESS", V6},
    {141, "LINE_CARD_ID", U},
    {142, "PORT_ID", U},
    {143, "METERING_PROCESS_ID", U},
    {144, "EXPORTING_PROCESS_ID", U},
    {145, "TEMPLATE_ID", U},
    {146, "WLAN_CHANNEL_ID", U},
    {147, "WLAN_SSID", TXT},
    {148, "FLOW_ID", U},
    {149, "OBSERVATION_DOMAIN_ID", U},
    {150, "FLOW_START_SECONDS", U},
    {151, "FLOW_END_SECONDS", U},
    {152, "FLOW_START_MILLISECONDS", U},
    {153, "FLOW_END_MILLISECONDS", U},
    {154, "FLOW_START_MICROSECONDS", U},
    {155, "FLOW_END_MICROSECONDS", U},
    {156, "FLOW_START_NANOSECONDS", U},
    {157, "FLOW_END_NANOSECONDS", U},
    {158, "FLOW_START_DELTA_MICROSECONDS", U},
    {159, "FLOW_END_DELTA_MICROSECONDS", U},
    {160, "SYSTEM_INIT_TIME_MILLISECONDS", U},
    {161, "FLOW_DURATION_MILLISECONDS", U},
    {162, "FLOW_DURATION_MICROSECONDS", U},
    {163, "OBSERVED_FLOW_TOTAL_COUNT", U},
    {164, "IGNORED_PACKET_TOTAL_COUNT", U},
    {165, "IGNORED_OCTET_TOTAL_COUNT", U},
    {166, "NOT_SENT_FLOW_TOTAL_COUNT", U},
    {167, "NOT_SENT_PACKET_TOTAL_COUNT", U},
    {168, "NOT_SENT_OCTET_TOTAL_COUNT", U},
    {176, "ICMP_TYPE_IPV4", U},
    {177, "ICMP_CODE_IPV4", U},
    {178, "ICMP_TYPE_IPV6", U},
    {179, "ICMP_CODE_IPV6", U},
    {180, "UDP_SOURCE_PORT", U},
    {181, "UDP_DESTINATION_PORT", U},
    {182, "TCP_SOURCE_PORT", U},
    {183, "TCP_DESTINATION_PORT", U},
    {184, "TCP_SEQUENCE_NUMBER", U},
    {185, "TCP_ACKNOWLEDGEMENT_NUMBER", U},
    {186, "TCP_WINDOW_SIZE", U},
    {187, "TCP_URGENT_POINTER", U},
    {188, "TCP_HEADER_LENGTH", U},
    {189, "IP_HEADER_LENGTH", U},
    {190, "TOTAL_LENGTH_IPV4", U},
    {191, "PAYLOAD_LENGTH_IPV6", U},
    {192, "IP_TTL", U},
    {193, "NEXT_HEADER_IPV6", U},
    {194, "MPLS_PAYLOAD_LENGTH", U},
    {195, "IP_DIFF_SERV_CODE_POINT", U},
    {196, "IP_PRECEDENCE", U},
    {197, "FRAGMENT_FLAGS", U},
    {198, "OCTET_DELTA_SUM_OF_SQUARES", U},
    {199, "OCTET_TOTAL_SUM_OF_SQUARES", U},
    {200, "MPLS_TOP_LABEL_TTL", U},
    {201, "MPLS_LABEL_STACK_LENGTH", U},
    {202, "MPLS_LABEL_STACK_DEPTH", U},
    {203, "MPLS_TOP_LABEL_EXP", U},
    {204, "IP_PAYLOAD_LENGTH", U},
    {205, "UDP_MESSAGE_LENGTH", U},
    {206, "IS_MULTICAST", U},
    {207, "IPV4_IHL", U},
    {208, "IPV4_OPTIONS", U},
    {209, "TCP_OPTIONS", U},
    {210, "PADDING_OCTETS", RAW},
    {211, "COLLECTOR_IPV4_ADDRESS", V4},
    {212, "COLLECTOR_IPV6_ADDRESS", V6},
    {213, "EXPORT_INTERFACE", U},
    {214, "EXPORT_PROTOCOL_VERSION", U},
    {215, "EXPORT_TRANSPORT_PROTOCOL", U},
    {216, "COLLECTOR_TRANSPORT_PORT", U},
    {217, "EXPORTER_TRANSPORT_PORT", U},
    {218, "TCP_SYN_TOTAL_COUNT", U},
    {219, "TCP_FIN_TOTAL_COUNT", U},
    {220, "TCP_RST_TOTAL_COUNT", U},
    {221, "TCP_PSH_TOTAL_COUNT", U},
    {222, "TCP_ACK_TOTAL_COUNT", U},
    {223, "TCP_URG_TOTAL_COUNT", U},
    {224, "IP_TOTAL_LENGTH", U},
    {225, "POST_NAT_SOURCE_IPV4_ADDRESS", V4},
    {226, "POST_NAT_DESTINATION_IPV4_ADDRESS", V4},
    {227, "POST_NAPT_SOURCE_TRANSPORT_PORT", U},
    {228, "POST_NAPT_DESTINATION_TRANSPORT_PORT", U},
    {229, "NAT_ORIGINATING_ADDRESS_REALM", U},
    {230, "NAT_EVENT", U},
    {231, "INITIATOR_OCTETS", U},
    {232, "RESPONDER_OCTETS", U},
    {233, "FIREWALL_EVENT", U},
    {234, "INGRESS_VRFID", U},
    {235, "EGRESS_VRFID", U},
    {236, "VRF_NAME", TXT},
    {237, "POST_MPLS_TOP_LABEL_EXP", U},
    {238, "TCP_WINDOW_SCALE", U},
    {239, "BIFLOW_DIRECTION", U},
    {240, "ETHERNET_HEADER_LENGTH", U},
    {241, "ETHERNET_PAYLOAD_LENGTH", U},
    {242, "ETHERNET_TOTAL_LENGTH", U},
    {243, "DOT1Q_VLAN_ID", U},
    {244, "DOT1Q_PRIORITY", U},
    {245, "DOT1Q_CUSTOMER_VLAN_ID", U},
    {246, "DOT1Q_CUSTOMER_PRIORITY", U},
    {256, "ETHERNET_TYPE", U},
    {281, "POST_NAT_SOURCE_IPV6_ADDRESS", V6},
    {282, "POST_NAT_DESTINATION_IPV6_ADDRESS", V6},
    {298, "INITIATOR_PACKETS", U},
    {299, "RESPONDER_PACKETS", U},
    {322, "OBSERVATION_TIME_SECONDS", U},
    {323, "OBSERVATION_TIME_MILLISECONDS", U},
    {324, "OBSERVATION_TIME_MICROSECONDS", U},
    {325, "OBSERVATION_TIME_NANOSECONDS", U},
};

using FieldTable = std::unordered_map<uint16_t, const FieldInfo*>;

template<size_t N>
FieldTable build_table(const FieldInfo (&entries)[N]) {
    FieldTable table;
    table.reserve(N);
    for (const auto& entry : entries) {
        table.emplace(entry.id, &entry);
    }
    return table;
}

const FieldTable& netflow_v9_table() {
    static const FieldTable table = build_table(NETFLOW_V9_FIELDS);
    return table;
}

const FieldTable& ipfix_table() {
    static const FieldTable table = build_table(IPFIX_FIELDS);
    return table;
}

const FieldInfo* find_in(const FieldTable& table, uint16_t id) {
    auto it = table.find(id);
    return it == table.end() ? nullptr : it->second;
}

} // namespace

const FieldInfo* lookup_field(ProtocolVersion version, uint16_t id) {
    if (version == ProtocolVersion::NETFLOW_V9) {
        return find_in(netflow_v9_table(), id);
    }

    // IPFIX keeps the v9 semantics for elements 1-127
    if (id < 128) {
        return find_in(netflow_v9_table(), id);
    }
    return find_in(ipfix_table(), id);
}

std::string field_name(ProtocolVersion version, uint16_t id, uint32_t enterprise_number) {
    if (enterprise_number != 0) {
        return "FIELD_" + std::to_string(enterprise_number) + "_" + std::to_string(id);
    }

    const FieldInfo* info = lookup_field(version, id);
    if (info == nullptr) {
        return "FIELD_" + std::to_string(id);
    }
    return info->name;
}

FieldKind field_kind(ProtocolVersion version, uint16_t id, uint32_t enterprise_number) {
    if (enterprise_number != 0) {
        return FieldKind::UNSIGNED;
    }

    const FieldInfo* info = lookup_field(version, id);
    return info == nullptr ? FieldKind::UNSIGNED : info->kind;
}

std::string protocol_version_name(ProtocolVersion version) {
    switch (version) {
    case ProtocolVersion::NETFLOW_V9:
        return "NetFlow v9";
    case ProtocolVersion::IPFIX:
        return "IPFIX";
    }
    return "unknown";
}

} // namespace nfcollect
