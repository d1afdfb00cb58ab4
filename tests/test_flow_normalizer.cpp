#include <gtest/gtest.h>
#include "test_support.hpp"
#include <nfcollect/flow_normalizer.hpp>
#include <nfcollect/packet_builder.hpp>
#include <nfcollect/packet_decoder.hpp>

using namespace nfcollect;
using namespace nfcollect::test;

class FlowNormalizerTest : public ::testing::Test {
protected:
    static FieldValue decode(uint16_t type, std::vector<uint8_t> bytes,
                             ProtocolVersion version = ProtocolVersion::NETFLOW_V9,
                             uint32_t enterprise = 0) {
        FieldSpec spec(type, static_cast<uint16_t>(bytes.size()), enterprise);
        return FlowNormalizer::decode_value(spec, bytes, version);
    }

    static RawField raw(uint16_t type, std::vector<uint8_t> bytes, uint32_t enterprise = 0) {
        RawField field;
        field.spec = FieldSpec(type, static_cast<uint16_t>(bytes.size()), enterprise);
        field.value = std::move(bytes);
        return field;
    }

    FlowNormalizer normalizer;
};

TEST_F(FlowNormalizerTest, Ipv4Address) {
    FieldValue value = decode(field_id::IPV4_SRC_ADDR, {10, 0, 0, 1});
    EXPECT_EQ(value.kind, FieldValue::Kind::ADDRESS);
    EXPECT_EQ(value.text, "10.0.0.1");
}

TEST_F(FlowNormalizerTest, Ipv6Address) {
    FieldValue value = decode(field_id::IPV6_DST_ADDR,
                              PacketBuilder::encode_ipv6("2001:db8::1"));
    EXPECT_EQ(value.kind, FieldValue::Kind::ADDRESS);
    EXPECT_EQ(value.text, "2001:db8::1");
}

TEST_F(FlowNormalizerTest, MacAddress) {
    FieldValue value = decode(56, {0x00, 0x11, 0x22, 0xaa, 0xbb, 0xcc});
    EXPECT_EQ(value.kind, FieldValue::Kind::MAC);
    EXPECT_EQ(value.text, "00:11:22:aa:bb:cc");
}

TEST_F(FlowNormalizerTest, ReducedSizeIntegers) {
    EXPECT_EQ(decode(field_id::IN_BYTES, {0x01, 0x00}).number, 256u);
    EXPECT_EQ(decode(field_id::IN_BYTES, {0x7f}).number, 127u);
    EXPECT_EQ(decode(field_id::IN_BYTES, {0, 0, 0, 1, 0, 0, 0, 0}).number, 4294967296u);
    EXPECT_TRUE(decode(field_id::IN_BYTES, {0x01, 0x00}).is_number());
}

TEST_F(FlowNormalizerTest, TextDropsTrailingNul) {
    FieldValue value = decode(82, {'e', 't', 'h', '0', 0, 0});
    EXPECT_EQ(value.kind, FieldValue::Kind::TEXT);
    EXPECT_EQ(value.text, "eth0");
}

TEST_F(FlowNormalizerTest, OpaqueBytesBecomeHex) {
    FieldValue value = decode(95, {0x0d, 0x00, 0x00, 0x50});
    EXPECT_EQ(value.kind, FieldValue::Kind::BYTES);
    EXPECT_EQ(value.text, "0d000050");
}

TEST_F(FlowNormalizerTest, AddressWithWrongLengthFallsBack) {
    FieldValue value = decode(field_id::IPV4_SRC_ADDR, {0x01, 0x02});
    EXPECT_TRUE(value.is_number());
    EXPECT_EQ(value.number, 0x0102u);
}

TEST_F(FlowNormalizerTest, LongUnknownFieldBecomesHex) {
    std::vector<uint8_t> bytes(10, 0xff);
    FieldValue value = decode(50000, bytes);
    EXPECT_EQ(value.kind, FieldValue::Kind::BYTES);
    EXPECT_EQ(value.text, "ffffffffffffffffffff");
}

TEST_F(FlowNormalizerTest, NormalizeRecordNames) {
    DataRecord record;
    record.template_id = 256;
    record.fields.push_back(raw(field_id::IPV4_SRC_ADDR, {192, 168, 1, 10}));
    record.fields.push_back(raw(field_id::IN_BYTES, {0, 0, 8, 0}));
    record.fields.push_back(raw(50000, {0, 3}));
    record.fields.push_back(raw(1, {0, 9}, 29305));

    FlowRecord flow = normalizer.normalize(record, ProtocolVersion::IPFIX);

    ASSERT_EQ(flow.size(), 4u);
    EXPECT_EQ(flow.fields()[0].first, "IPV4_SRC_ADDR");
    EXPECT_EQ(flow.get_text(flow_key::IPV4_SRC_ADDR), "192.168.1.10");
    EXPECT_EQ(flow.get_uint(flow_key::IN_BYTES), 2048u);
    EXPECT_EQ(flow.get_uint("FIELD_50000"), 3u);
    EXPECT_EQ(flow.get_uint("FIELD_29305_1"), 9u);
}

TEST_F(FlowNormalizerTest, OptionsRecordsAreNotFlows) {
    DecodedPacket packet;
    packet.header.version = 9;

    DataRecord options;
    options.kind = TemplateKind::OPTIONS;
    options.fields.push_back(raw(34, {0, 0, 0, 100}));
    packet.records.push_back(options);

    DataRecord data;
    data.fields.push_back(raw(field_id::IN_BYTES, {0, 0, 0, 1}));
    packet.records.push_back(data);

    std::vector<FlowRecord> flows = normalizer.normalize(packet);
    ASSERT_EQ(flows.size(), 1u);
    EXPECT_EQ(flows[0].get_uint(flow_key::IN_BYTES), 1u);
    EXPECT_EQ(normalizer.stats().flows, 1u);
    EXPECT_EQ(normalizer.stats().options_records, 1u);
}

TEST_F(FlowNormalizerTest, DecodedPacketEndToEnd) {
    TemplateStore store;
    PacketDecoder decoder(store);

    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    builder.add_template(256, ipv4_layout());
    builder.add_data_set(256, {ipv4_record("10.1.1.1", "10.2.2.2", 5000, 443, 777, 10, 20)},
                         ipv4_layout());

    std::vector<FlowRecord> flows = normalizer.normalize(decoder.decode(builder.build(), "192.0.2.1"));
    ASSERT_EQ(flows.size(), 1u);

    const FlowRecord& flow = flows[0];
    EXPECT_EQ(flow.ip_version(), 4);
    EXPECT_EQ(flow.source_address(), "10.1.1.1");
    EXPECT_EQ(flow.destination_address(), "10.2.2.2");
    EXPECT_EQ(flow.source_port(), 5000);
    EXPECT_EQ(flow.destination_port(), 443);
    EXPECT_EQ(flow.protocol(), 6);
    EXPECT_EQ(flow.get_uint(flow_key::IN_BYTES), 777u);
    EXPECT_EQ(flow.get_uint(flow_key::LAST_SWITCHED), 20u);
}

TEST(FlowRecordTest, IpVersionRule) {
    FlowRecord empty;
    EXPECT_EQ(empty.ip_version(), 6);

    FlowRecord declared;
    declared.set(flow_key::IP_PROTOCOL_VERSION, FieldValue::from_uint(4));
    EXPECT_EQ(declared.ip_version(), 4);

    FlowRecord destination_only;
    destination_only.set(flow_key::IPV4_DST_ADDR, FieldValue::from_address("10.0.0.1"));
    EXPECT_EQ(destination_only.ip_version(), 4);

    FlowRecord v6;
    v6.set(flow_key::IP_PROTOCOL_VERSION, FieldValue::from_uint(6));
    v6.set(flow_key::IPV6_SRC_ADDR, FieldValue::from_address("2001:db8::1"));
    v6.set(flow_key::IPV6_DST_ADDR, FieldValue::from_address("2001:db8::2"));
    EXPECT_EQ(v6.ip_version(), 6);
    EXPECT_EQ(v6.source_address(), "2001:db8::1");
    EXPECT_EQ(v6.destination_address(), "2001:db8::2");
}

TEST(FlowRecordTest, SetReplacesInPlace) {
    FlowRecord flow;
    flow.set("A", FieldValue::from_uint(1));
    flow.set("B", FieldValue::from_uint(2));
    flow.set("A", FieldValue::from_uint(3));

    ASSERT_EQ(flow.size(), 2u);
    EXPECT_EQ(flow.fields()[0].first, "A");
    EXPECT_EQ(flow.get_uint("A"), 3u);
    EXPECT_FALSE(flow.get_uint("C").has_value());
    EXPECT_FALSE(flow.has("C"));
}
