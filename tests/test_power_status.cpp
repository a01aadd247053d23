#include <doctest/doctest.h>
#include <memory>
#include "cecflow/local_device.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/transport/simulated_bus.hpp"

using namespace cecflow;

namespace {

struct Rig {
    transport::SimulatedBus bus;
    transport::SimulatedDisplay tv;
    DeviceConfig cfg;
    std::unique_ptr<LocalDevice> dev;
    uint32_t now = 0;

    explicit Rig(bool with_tv = true) {
        if (with_tv) bus.attach(tv);
        dev.reset(new LocalDevice(bus, cfg));
    }

    void run_until(uint32_t until, uint32_t step = 100) {
        for (; now <= until; now += step) dev->tick(now);
    }
};

} // namespace

TEST_CASE("Power query delivers the reported status") {
    Rig rig;
    int status = -2;
    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { status = r; })));
    CHECK(rig.bus.sent().at(0) == build_give_device_power_status(ADDR_PLAYBACK_1, ADDR_TV));

    rig.run_until(0);
    CHECK(status == POWER_STATUS_STANDBY);
    CHECK(rig.dev->action_count() == 0);
}

TEST_CASE("Power query after one touch play sees the display on") {
    Rig rig;
    int otp = -1, status = -2;
    REQUIRE(rig.dev->one_touch_play(make_callback([&](int r) { otp = r; })));
    rig.run_until(0);
    REQUIRE(otp == RESULT_SUCCESS);

    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { status = r; })));
    rig.run_until(200);
    CHECK(status == POWER_STATUS_ON);
}

TEST_CASE("Silent display: unknown after one timeout, no retries") {
    Rig rig;
    rig.tv.set_silent(true);
    int status = -2;
    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { status = r; })));

    rig.run_until(1900);
    CHECK(status == -2);
    rig.run_until(2000);
    CHECK(status == POWER_STATUS_UNKNOWN);
    CHECK(rig.bus.count_sent(OP_GIVE_DEVICE_POWER_STATUS) == 1);
}

TEST_CASE("Unacknowledged query: unknown at once") {
    Rig rig(false);
    int status = -2;
    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { status = r; })));
    rig.run_until(0);
    CHECK(status == POWER_STATUS_UNKNOWN);
    uint64_t next = 0;
    CHECK_FALSE(rig.dev->next_timer_deadline(next));
}

TEST_CASE("Concurrent power queries merge") {
    Rig rig;
    int a = -2, b = -2;
    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { a = r; })));
    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { b = r; })));
    CHECK(rig.bus.count_sent(OP_GIVE_DEVICE_POWER_STATUS) == 1);
    rig.run_until(0);
    CHECK(a == POWER_STATUS_STANDBY);
    CHECK(b == POWER_STATUS_STANDBY);
}

TEST_CASE("Out-of-range status bytes are reported as unknown") {
    Rig rig;
    rig.bus.set_auto_complete(false);
    int status = -2;
    REQUIRE(rig.dev->query_display_status(make_callback([&](int r) { status = r; })));
    CHECK(rig.dev->dispatch_message(build_report_power_status(ADDR_TV, ADDR_PLAYBACK_1, 0x07)));
    CHECK(status == POWER_STATUS_UNKNOWN);
}
