#include <gtest/gtest.h>
#include "test_support.hpp"
#include <nfcollect/packet_builder.hpp>
#include <nfcollect/packet_decoder.hpp>
#include <nfcollect/utils.hpp>

using namespace nfcollect;
using namespace nfcollect::test;

class PacketDecoderTest : public ::testing::Test {
protected:
    PacketDecoderTest() : decoder(store) {}

    DecodedPacket decode(const std::vector<uint8_t>& datagram) {
        return decoder.decode(datagram, EXPORTER);
    }

    static uint64_t field_uint(const DataRecord& record, size_t index) {
        const auto& value = record.fields.at(index).value;
        return utils::read_be(value.data(), value.size());
    }

    const std::string EXPORTER = "192.0.2.1";
    TemplateStore store;
    PacketDecoder decoder;
};

TEST_F(PacketDecoderTest, NetflowV9TemplateAndData) {
    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 42, 3, 123456);
    builder.add_template(256, ipv4_layout());
    builder.add_data_set(256, {
        ipv4_record("10.0.0.1", "10.0.0.2", 1234, 80, 500, 1000, 2000),
        ipv4_record("10.0.0.2", "10.0.0.1", 80, 1234, 1500, 1000, 2000),
    }, ipv4_layout());

    DecodedPacket packet = decode(builder.build());

    EXPECT_EQ(packet.header.version, 9);
    EXPECT_EQ(packet.header.count, 3);
    EXPECT_EQ(packet.header.sys_uptime_ms, 123456u);
    EXPECT_EQ(packet.header.unix_secs, EXPORT_TIME);
    EXPECT_EQ(packet.header.sequence, 42u);
    EXPECT_EQ(packet.header.source_id, 3u);
    EXPECT_EQ(packet.exporter.address, EXPORTER);
    EXPECT_EQ(packet.exporter.domain_id, 3u);

    EXPECT_EQ(packet.templates_learned, 1u);
    ASSERT_EQ(packet.records.size(), 2u);
    EXPECT_EQ(packet.data_record_count(), 2u);

    const DataRecord& record = packet.records[0];
    EXPECT_EQ(record.template_id, 256);
    EXPECT_EQ(record.kind, TemplateKind::DATA);
    ASSERT_EQ(record.fields.size(), ipv4_layout().size());
    EXPECT_EQ(record.fields[0].spec.type, field_id::IPV4_SRC_ADDR);
    EXPECT_EQ(record.fields[0].value, PacketBuilder::encode_ipv4("10.0.0.1"));
    EXPECT_EQ(field_uint(record, 2), 1234u);
    EXPECT_EQ(field_uint(record, 5), 500u);
    EXPECT_EQ(field_uint(packet.records[1], 5), 1500u);
}

TEST_F(PacketDecoderTest, TemplateDefinitionIsStoredExactly) {
    const std::vector<FieldSpec> layout = {
        {field_id::IPV6_SRC_ADDR, 16},
        {field_id::IN_BYTES, 8},
        {1, 4, 9},                  // enterprise-specific field
        {82, VARIABLE_LENGTH},
    };

    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 0, 5);
    builder.add_template(300, layout);
    DecodedPacket packet = decode(builder.build());
    EXPECT_EQ(packet.templates_learned, 1u);

    const Template* tmpl = store.get(Exporter{EXPORTER, 5}, 300);
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->version, ProtocolVersion::IPFIX);
    EXPECT_EQ(tmpl->kind, TemplateKind::DATA);
    EXPECT_EQ(tmpl->fields, layout);
    EXPECT_EQ(tmpl->fields[2].enterprise_number, 9u);
    EXPECT_TRUE(tmpl->has_variable_length_fields());
}

TEST_F(PacketDecoderTest, UnknownTemplateSetIsSkipped) {
    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 1);
    builder.add_raw_set(300, std::vector<uint8_t>(12, 0xAB));
    builder.add_template(256, ipv4_layout());
    builder.add_data_set(256, {ipv4_record("10.0.0.1", "10.0.0.2", 1, 2, 3)}, ipv4_layout());

    DecodedPacket packet = decode(builder.build());

    EXPECT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(packet.unknown_template_sets, 1u);
    ASSERT_EQ(packet.missing_templates.size(), 1u);
    EXPECT_EQ(packet.missing_templates[0], 300);
}

TEST_F(PacketDecoderTest, DataBeforeTemplateAcrossPackets) {
    PacketBuilder data(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 1);
    data.add_data_set(256, {ipv4_record("10.0.0.1", "10.0.0.2", 1, 2, 3)}, ipv4_layout());
    std::vector<uint8_t> datagram = data.build();

    DecodedPacket early = decode(datagram);
    EXPECT_TRUE(early.records.empty());
    EXPECT_EQ(early.unknown_template_sets, 1u);

    PacketBuilder announce(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 2);
    announce.add_template(256, ipv4_layout());
    decode(announce.build());

    DecodedPacket late = decode(datagram);
    EXPECT_EQ(late.records.size(), 1u);
    EXPECT_EQ(late.unknown_template_sets, 0u);
}

TEST_F(PacketDecoderTest, TemplatesOfOtherExportersAreNotUsed) {
    PacketBuilder announce(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 1);
    announce.add_template(256, ipv4_layout());
    decoder.decode(announce.build(), "192.0.2.99");

    PacketBuilder data(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 2);
    data.add_data_set(256, {ipv4_record("10.0.0.1", "10.0.0.2", 1, 2, 3)}, ipv4_layout());
    DecodedPacket packet = decode(data.build());

    EXPECT_TRUE(packet.records.empty());
    EXPECT_EQ(packet.unknown_template_sets, 1u);
}

TEST_F(PacketDecoderTest, IpfixVariableLengthFields) {
    const std::vector<FieldSpec> layout = {
        {82, VARIABLE_LENGTH},
        {field_id::IN_BYTES, 4},
    };
    const std::string long_name(300, 'x');

    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    builder.add_template(256, layout);
    builder.add_data_set(256, {
        {PacketBuilder::encode_text("eth0"), PacketBuilder::encode_uint(10, 4)},
        {PacketBuilder::encode_text(long_name), PacketBuilder::encode_uint(20, 4)},
    }, layout);
    std::vector<uint8_t> datagram = builder.build();

    DecodedPacket packet = decode(datagram);

    ASSERT_EQ(packet.records.size(), 2u);
    EXPECT_EQ(packet.records[0].fields[0].value, PacketBuilder::encode_text("eth0"));
    EXPECT_EQ(field_uint(packet.records[0], 1), 10u);
    EXPECT_EQ(packet.records[1].fields[0].value.size(), 300u);
    EXPECT_EQ(field_uint(packet.records[1], 1), 20u);
}

TEST_F(PacketDecoderTest, VariableLengthLongFormOnTheWire) {
    // Template 256 = { IF_NAME (variable) }
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, {{82, VARIABLE_LENGTH}});
    decode(announce.build());

    // 255 announces a two-byte length: 0x012C = 300
    std::vector<uint8_t> body = {0xFF, 0x01, 0x2C};
    body.insert(body.end(), 300, 'a');
    PacketBuilder data(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    data.add_raw_set(256, body);

    DecodedPacket packet = decode(data.build());
    ASSERT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(packet.records[0].fields[0].value, std::vector<uint8_t>(300, 'a'));
}

TEST_F(PacketDecoderTest, VariableLengthOverrunThrows) {
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, {{82, VARIABLE_LENGTH}});
    decode(announce.build());

    // Declares 200 bytes, carries 10
    std::vector<uint8_t> body = {200};
    body.insert(body.end(), 10, 'a');
    PacketBuilder data(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    data.add_raw_set(256, body);

    EXPECT_THROW(decode(data.build()), DecodeError);
}

TEST_F(PacketDecoderTest, EnterpriseFieldIsDecoded) {
    const std::vector<FieldSpec> layout = {
        {field_id::IN_BYTES, 4},
        {1, 2, 29305},
    };
    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    builder.add_template(256, layout);
    builder.add_data_set(256, {
        {PacketBuilder::encode_uint(99, 4), PacketBuilder::encode_uint(7, 2)},
    }, layout);

    DecodedPacket packet = decode(builder.build());
    ASSERT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(packet.records[0].fields[1].spec.type, 1);
    EXPECT_EQ(packet.records[0].fields[1].spec.enterprise_number, 29305u);
    EXPECT_EQ(field_uint(packet.records[0], 1), 7u);
}

TEST_F(PacketDecoderTest, IpfixTemplateWithdrawal) {
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, ipv4_layout());
    announce.add_template(257, {{field_id::IN_BYTES, 4}});
    decode(announce.build());
    ASSERT_EQ(store.size(), 2u);

    PacketBuilder withdraw(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    withdraw.add_template_withdrawal(256);
    DecodedPacket packet = decode(withdraw.build());

    EXPECT_EQ(packet.templates_withdrawn, 1u);
    EXPECT_EQ(store.get(Exporter{EXPORTER, 0}, 256), nullptr);
    EXPECT_NE(store.get(Exporter{EXPORTER, 0}, 257), nullptr);
}

TEST_F(PacketDecoderTest, IpfixWithdrawAll) {
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, ipv4_layout());
    announce.add_template(257, {{field_id::IN_BYTES, 4}});
    decode(announce.build());

    PacketBuilder withdraw(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    withdraw.add_template_withdrawal(IPFIX_TEMPLATE_SET_ID);
    DecodedPacket packet = decode(withdraw.build());

    EXPECT_EQ(packet.templates_withdrawn, 2u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(PacketDecoderTest, NetflowV9OptionsTemplate) {
    const std::vector<FieldSpec> scope = {{1, 4}};      // scope: system
    const std::vector<FieldSpec> options = {{34, 4}};   // SAMPLING_INTERVAL

    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    builder.add_options_template(260, scope, options);
    builder.add_data_set(260, {
        {PacketBuilder::encode_uint(1, 4), PacketBuilder::encode_uint(100, 4)},
    }, {{1, 4}, {34, 4}});

    DecodedPacket packet = decode(builder.build());

    const Template* tmpl = store.get(Exporter{EXPORTER, 0}, 260);
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->kind, TemplateKind::OPTIONS);
    EXPECT_EQ(tmpl->scope_field_count, 1);
    ASSERT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(packet.records[0].kind, TemplateKind::OPTIONS);
    EXPECT_EQ(packet.data_record_count(), 0u);
    EXPECT_EQ(packet.options_record_count(), 1u);
    EXPECT_EQ(field_uint(packet.records[0], 1), 100u);
}

TEST_F(PacketDecoderTest, IpfixOptionsTemplate) {
    const std::vector<FieldSpec> scope = {{149, 4}};    // observationDomainId
    const std::vector<FieldSpec> options = {{40, 8}, {41, 8}};

    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    builder.add_options_template(261, scope, options);
    DecodedPacket packet = decode(builder.build());

    EXPECT_EQ(packet.templates_learned, 1u);
    const Template* tmpl = store.get(Exporter{EXPORTER, 0}, 261);
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->kind, TemplateKind::OPTIONS);
    EXPECT_EQ(tmpl->scope_field_count, 1);
    EXPECT_EQ(tmpl->fields.size(), 3u);
}

TEST_F(PacketDecoderTest, IpfixOptionsTemplateWithoutScopeThrows) {
    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    builder.add_options_template(261, {}, {{40, 8}});
    EXPECT_THROW(decode(builder.build()), DecodeError);
}

TEST_F(PacketDecoderTest, TrailingPaddingIsIgnored) {
    PacketBuilder announce(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    announce.add_template(256, {{field_id::IN_BYTES, 4}, {field_id::IN_PKTS, 4}});
    decode(announce.build());

    std::vector<uint8_t> body = {0, 0, 0, 7, 0, 0, 0, 1, 0, 0, 0};  // one record, 3 pad bytes
    PacketBuilder data(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 1);
    data.add_raw_set(256, body);

    DecodedPacket packet = decode(data.build());
    ASSERT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(field_uint(packet.records[0], 0), 7u);
}

TEST_F(PacketDecoderTest, VariableLengthSetPaddingIsIgnored) {
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, {{82, VARIABLE_LENGTH}});
    decode(announce.build());

    // "abc" with its length prefix, then 2 bytes of padding to a 32-bit boundary
    std::vector<uint8_t> body = {3, 'a', 'b', 'c', 0, 0};
    PacketBuilder data(ProtocolVersion::IPFIX, EXPORT_TIME, 1);
    data.add_raw_set(256, body);

    DecodedPacket packet = decode(data.build());
    ASSERT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(packet.records[0].fields[0].value, PacketBuilder::encode_text("abc"));
}

TEST_F(PacketDecoderTest, PaddingAfterMixedVariableRecordIsIgnored) {
    // Template 256 = { IF_NAME (variable), IN_BYTES (4) }, minimum record 5 bytes
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, {{82, VARIABLE_LENGTH}, {field_id::IN_BYTES, 4}});
    decode(announce.build());

    // One 11-byte record, then 5 zero bytes that would otherwise parse as an empty record
    std::vector<uint8_t> body = {6, 'e', 't', 'h', '0', '.', '1', 0, 0, 0, 9, 0, 0, 0, 0, 0};
    PacketBuilder data(ProtocolVersion::IPFIX, EXPORT_TIME, 1);
    data.add_raw_set(256, body);

    DecodedPacket packet = decode(data.build());
    ASSERT_EQ(packet.records.size(), 1u);
    EXPECT_EQ(field_uint(packet.records[0], 1), 9u);
}

TEST_F(PacketDecoderTest, EmptyVariableLengthRecordsAreDecoded) {
    PacketBuilder announce(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    announce.add_template(256, {{82, VARIABLE_LENGTH}});
    decode(announce.build());

    // Zero-length values are records of the same size, not padding
    std::vector<uint8_t> body = {0, 0, 0, 0};
    PacketBuilder data(ProtocolVersion::IPFIX, EXPORT_TIME, 1);
    data.add_raw_set(256, body);

    DecodedPacket packet = decode(data.build());
    ASSERT_EQ(packet.records.size(), 4u);
    EXPECT_TRUE(packet.records[3].fields[0].value.empty());
}

TEST_F(PacketDecoderTest, ReservedTemplateIdIsRejected) {
    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    builder.add_template(100, ipv4_layout());

    DecodedPacket packet = decode(builder.build());
    EXPECT_EQ(packet.templates_rejected, 1u);
    EXPECT_EQ(packet.templates_learned, 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(PacketDecoderTest, ReservedSetIdIsSkipped) {
    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    builder.add_raw_set(5, {0, 0, 0, 0});

    DecodedPacket packet = decode(builder.build());
    EXPECT_EQ(packet.skipped_sets, 1u);
    EXPECT_TRUE(packet.records.empty());
}

TEST_F(PacketDecoderTest, TruncatedHeaderThrows) {
    std::vector<uint8_t> datagram = {0x00, 0x09, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_THROW(decode(datagram), DecodeError);
    EXPECT_THROW(decode(std::vector<uint8_t>()), DecodeError);
}

TEST_F(PacketDecoderTest, UnsupportedVersionThrows) {
    std::vector<uint8_t> datagram(24, 0);
    datagram[1] = 5;
    EXPECT_THROW(decode(datagram), DecodeError);
}

TEST_F(PacketDecoderTest, SetLongerThanPacketThrows) {
    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    builder.add_template(256, ipv4_layout());
    builder.add_data_set(256, {ipv4_record("10.0.0.1", "10.0.0.2", 1, 2, 3)}, ipv4_layout());
    std::vector<uint8_t> datagram = builder.build();
    datagram.resize(datagram.size() - 5);

    EXPECT_THROW(decode(datagram), DecodeError);
}

TEST_F(PacketDecoderTest, SetShorterThanHeaderThrows) {
    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    std::vector<uint8_t> datagram = builder.build();
    utils::append_be(datagram, 256, 2);
    utils::append_be(datagram, 2, 2);

    EXPECT_THROW(decode(datagram), DecodeError);
}

TEST_F(PacketDecoderTest, IpfixLengthBeyondDatagramThrows) {
    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 0);
    builder.add_template(256, ipv4_layout());
    std::vector<uint8_t> datagram = builder.build();
    datagram.pop_back();

    EXPECT_THROW(decode(datagram), DecodeError);
}

TEST_F(PacketDecoderTest, TruncatedTemplateRecordThrows) {
    // Announces three field specifiers, carries one
    std::vector<uint8_t> body;
    utils::append_be(body, 256, 2);
    utils::append_be(body, 3, 2);
    utils::append_be(body, field_id::IN_BYTES, 2);
    utils::append_be(body, 4, 2);

    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 0);
    builder.add_raw_set(NETFLOW_V9_TEMPLATE_SET_ID, body);

    EXPECT_THROW(decode(builder.build()), DecodeError);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(PacketDecoderTest, ParseHeaderOnly) {
    PacketBuilder builder(ProtocolVersion::IPFIX, EXPORT_TIME, 77, 12);
    std::vector<uint8_t> datagram = builder.build();

    PacketHeader header = PacketDecoder::parse_header(datagram.data(), datagram.size());
    EXPECT_EQ(header.protocol(), ProtocolVersion::IPFIX);
    EXPECT_EQ(header.length, IPFIX_HEADER_LENGTH);
    EXPECT_EQ(header.sequence, 77u);
    EXPECT_EQ(header.source_id, 12u);
}
