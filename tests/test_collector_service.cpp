#include <gtest/gtest.h>
#include "test_support.hpp"
#include <nfcollect/collector.hpp>
#include <nfcollect/packet_builder.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <functional>
#include <sstream>
#include <thread>

using namespace nfcollect;
using namespace nfcollect::test;
using json = nlohmann::json;

class CollectorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.listen_address = "127.0.0.1";
        config.port = 0;
        config.workers = 2;
        config.receive_timeout_ms = 50;
        config.batch_timeout_ms = 100;
    }

    std::vector<std::unique_ptr<ExportSink>> sinks() {
        std::vector<std::unique_ptr<ExportSink>> result;
        result.push_back(std::make_unique<JsonExportSink>(flows_out, ExportContent::FLOWS));
        result.push_back(std::make_unique<JsonExportSink>(connections_out,
                                                          ExportContent::CONNECTIONS));
        return result;
    }

    static void send_datagram(uint16_t port, const std::vector<uint8_t>& datagram) {
        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(fd, 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        ssize_t sent = sendto(fd, datagram.data(), datagram.size(), 0,
                              reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        close(fd);
        ASSERT_EQ(sent, static_cast<ssize_t>(datagram.size()));
    }

    static bool wait_for(const std::function<bool()>& condition) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    CollectorConfig config;
    std::ostringstream flows_out;
    std::ostringstream connections_out;
};

TEST_F(CollectorServiceTest, ReceivesDecodesAndExports) {
    CollectorService service(config, sinks());
    service.start();
    ASSERT_TRUE(service.is_running());
    ASSERT_NE(service.bound_port(), 0);

    PacketBuilder builder(ProtocolVersion::NETFLOW_V9, EXPORT_TIME, 1);
    builder.add_template(256, ipv4_layout());
    builder.add_data_set(256, {
        ipv4_record("192.168.1.10", "203.0.113.5", 51000, 443, 120000, 1000, 2500),
        ipv4_record("203.0.113.5", "192.168.1.10", 443, 51000, 4800000, 1000, 65000),
    }, ipv4_layout());
    send_datagram(service.bound_port(), builder.build());

    // Truncated header: counted and dropped, the service keeps going
    send_datagram(service.bound_port(), {0x00, 0x09, 0x00});

    EXPECT_TRUE(wait_for([&] {
        CollectorStats stats = service.stats();
        return stats.flows >= 2 && stats.datagrams_invalid >= 1;
    }));
    EXPECT_TRUE(service.is_running());

    service.stop();
    EXPECT_FALSE(service.is_running());

    CollectorStats stats = service.stats();
    EXPECT_EQ(stats.datagrams_received, 2u);
    EXPECT_EQ(stats.datagrams_invalid, 1u);
    EXPECT_EQ(stats.flows, 2u);
    EXPECT_EQ(stats.connections, 1u);
    EXPECT_EQ(stats.batches_written, 1u);
    EXPECT_EQ(stats.export_errors, 0u);

    json flows = json::parse(flows_out.str());
    ASSERT_TRUE(flows.contains("1704067200"));
    EXPECT_EQ(flows["1704067200"].size(), 2u);

    json connections = json::parse(connections_out.str());
    const json& connection = connections["1704067200"].at(0);
    EXPECT_EQ(connection["src"], "203.0.113.5");
    EXPECT_EQ(connection["dest"], "192.168.1.10");
    EXPECT_EQ(connection["size"], 4800000);
    EXPECT_EQ(connection["duration"], 64000);
}

TEST_F(CollectorServiceTest, StopWithoutTrafficIsClean) {
    CollectorService service(config, sinks());
    service.start();
    service.stop();

    EXPECT_FALSE(service.is_running());
    EXPECT_EQ(service.stats().datagrams_received, 0u);
    EXPECT_TRUE(flows_out.str().empty());

    // A second stop is a no-op
    service.stop();
}

TEST_F(CollectorServiceTest, StartTwiceThrows) {
    CollectorService service(config, sinks());
    service.start();
    EXPECT_THROW(service.start(), std::runtime_error);
    service.stop();
}

TEST_F(CollectorServiceTest, PortInUseThrows) {
    CollectorService first(config, sinks());
    first.start();

    CollectorConfig taken = config;
    taken.port = first.bound_port();
    CollectorService second(taken, sinks());
    EXPECT_THROW(second.start(), std::runtime_error);
    EXPECT_FALSE(second.is_running());

    first.stop();
}

TEST_F(CollectorServiceTest, InvalidConfigurationThrows) {
    config.workers = 0;
    EXPECT_THROW(CollectorService service(config, sinks()), ConfigError);
}

TEST_F(CollectorServiceTest, UnwritableExportPathThrows) {
    config.output_path = "/nonexistent-nfcollect-dir/flows.json";
    EXPECT_THROW(CollectorService service(config), ExportError);
}
