#include <doctest/doctest.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>
#include "cecflow/slip.hpp"
#include "cecflow/serial_io.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/transport/serial_bus_transport.hpp"

using namespace cecflow;
using transport::SerialBusTransport;

namespace {

// Bridge side of a socket pair: the transport owns the other end.
struct Bridge {
    int fd = -1;
    SerialBusTransport link;

    Bridge() {
        int sv[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
        fd = sv[0];
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
        REQUIRE(link.adopt(sv[1]));
    }
    ~Bridge() { if (fd >= 0) ::close(fd); }

    void reply(const std::vector<uint8_t>& payload) { REQUIRE(write_frame(fd, payload)); }

    std::vector<std::vector<uint8_t>> frames_from_host() {
        std::vector<uint8_t> bytes;
        ::usleep(1000);
        read_available(fd, bytes);
        std::vector<std::vector<uint8_t>> out;
        std::vector<uint8_t> frame;
        for (uint8_t b : bytes) if (dec.feed(b, frame)) out.push_back(frame);
        return out;
    }

    slip::Decoder dec;
};

} // namespace

TEST_CASE("SLIP encode escapes END and ESC inside the payload") {
    const uint8_t in[] = {0x01, slip::END, 0x02, slip::ESC};
    std::vector<uint8_t> out;
    slip::encode(in, sizeof in, out);
    CHECK(out == std::vector<uint8_t>({slip::END, 0x01, slip::ESC, slip::ESC_END, 0x02,
                                       slip::ESC, slip::ESC_ESC, slip::END}));
}

TEST_CASE("SLIP decoder skips noise, resyncs on bad escapes, drops oversize frames") {
    slip::Decoder dec;
    std::vector<uint8_t> frame;
    std::vector<std::vector<uint8_t>> got;
    auto feed = [&](const std::vector<uint8_t>& bytes) {
        for (uint8_t b : bytes) if (dec.feed(b, frame)) got.push_back(frame);
    };

    feed({'b', 'o', 'o', 't', slip::END, 0x02, 0x00, slip::END});
    REQUIRE(got.size() == 1);
    CHECK(got[0] == std::vector<uint8_t>({0x02, 0x00}));

    feed({slip::END, 0x03, slip::ESC, 0x42, 0x44, slip::END});   // bad escape
    CHECK(got.size() == 1);
    CHECK(dec.dropped() == 1);

    std::vector<uint8_t> big(slip::Decoder::MAX_FRAME + 1, 0x11);
    big.insert(big.begin(), slip::END);
    big.push_back(slip::END);
    feed(big);
    CHECK(got.size() == 1);
    CHECK(dec.dropped() == 2);

    feed({slip::END, slip::END, 0x02, 0x01, slip::END});          // empty frame then one
    REQUIRE(got.size() == 2);
    CHECK(got[1] == std::vector<uint8_t>({0x02, 0x01}));
}

TEST_CASE("Bridge status values map to transport results") {
    CHECK(SerialBusTransport::status_to_result(0) == TransportResult::Success);
    CHECK(SerialBusTransport::status_to_result(1) == TransportResult::Nack);
    CHECK(SerialBusTransport::status_to_result(2) == TransportResult::Busy);
    CHECK(SerialBusTransport::status_to_result(9) == TransportResult::Fail);
}

TEST_CASE("Sends go out as BRIDGE_TX frames and complete in order from poll()") {
    Bridge bridge;
    std::vector<TransportResult> done;
    bridge.link.send(build_text_view_on(4, 0), [&](TransportResult r) { done.push_back(r); });
    bridge.link.send(build_active_source(4, 0x1000), [&](TransportResult r) { done.push_back(r); });
    CHECK(done.empty());
    CHECK(bridge.link.pending_count() == 2);

    auto frames = bridge.frames_from_host();
    REQUIRE(frames.size() == 2);
    CHECK(frames[0] == std::vector<uint8_t>({SerialBusTransport::BRIDGE_TX, 0x40, OP_TEXT_VIEW_ON}));
    CHECK(frames[1] == std::vector<uint8_t>({SerialBusTransport::BRIDGE_TX, 0x4F, OP_ACTIVE_SOURCE, 0x10, 0x00}));

    bridge.reply({SerialBusTransport::BRIDGE_TX_STATUS, 1});
    bridge.reply({SerialBusTransport::BRIDGE_TX_STATUS, 0});
    ::usleep(1000);
    bridge.link.poll();
    CHECK(done == std::vector<TransportResult>({TransportResult::Nack, TransportResult::Success}));
    CHECK(bridge.link.pending_count() == 0);
}

TEST_CASE("BRIDGE_RX frames become received messages") {
    Bridge bridge;
    bridge.reply({SerialBusTransport::BRIDGE_RX, 0x04, OP_REPORT_POWER_STATUS, POWER_STATUS_ON});
    bridge.reply({0x7E, 0x00});                               // unknown frame type: ignored
    ::usleep(1000);
    bridge.link.poll();

    CecMessage m;
    REQUIRE(bridge.link.receive(m));
    CHECK(m == build_report_power_status(ADDR_TV, ADDR_PLAYBACK_1, POWER_STATUS_ON));
    CHECK_FALSE(bridge.link.receive(m));
}

TEST_CASE("A send on a closed link fails on the next poll, never inline") {
    SerialBusTransport link;
    int calls = 0;
    TransportResult got = TransportResult::Success;
    link.send(build_standby(4, 0), [&](TransportResult r) { ++calls; got = r; });
    CHECK(calls == 0);
    link.poll();
    CHECK(calls == 1);
    CHECK(got == TransportResult::Fail);
}

TEST_CASE("A status sent just before the bridge hangs up is still honoured") {
    Bridge bridge;
    std::vector<TransportResult> done;
    bridge.link.send(build_standby(4, 0), [&](TransportResult r) { done.push_back(r); });
    bridge.link.send(build_standby(4, 5), [&](TransportResult r) { done.push_back(r); });

    bridge.reply({SerialBusTransport::BRIDGE_TX_STATUS, 1});
    bridge.reply({SerialBusTransport::BRIDGE_RX, 0x04, OP_REPORT_POWER_STATUS, POWER_STATUS_STANDBY});
    ::close(bridge.fd);
    bridge.fd = -1;
    ::usleep(1000);

    bridge.link.poll();
    CHECK_FALSE(bridge.link.is_open());
    // the answered send keeps its real status; the unanswered one fails
    CHECK(done == std::vector<TransportResult>({TransportResult::Nack, TransportResult::Fail}));

    CecMessage m;
    REQUIRE(bridge.link.receive(m));
    CHECK(m.opcode() == OP_REPORT_POWER_STATUS);
}
