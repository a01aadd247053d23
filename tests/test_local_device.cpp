#include <doctest/doctest.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "cecflow/local_device.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/log.hpp"
#include "cecflow/transport/simulated_bus.hpp"

using namespace cecflow;

// Minimal action for exercising the registry: claims one opcode, records what it sees.
class ProbeAction : public FeatureAction {
public:
    ProbeAction(LocalDevice& dev, uint8_t target, uint8_t claim_opcode, bool start_ok = true)
    : FeatureAction(dev, target), claim_(claim_opcode), start_ok_(start_ok) {}

    ActionKind kind() const override { return ActionKind::PowerStatus; }
    bool start() override { if (start_ok_) enter_state(1); return start_ok_; }
    bool process_command(const CecMessage& cmd) override {
        seen.push_back(cmd);
        return cmd.opcode() == claim_;
    }

    void wait(uint32_t ms) { enter_state(1); add_timer(ms); }
    void send(const CecMessage& m, transport::SendCallback done) { send_command(m, std::move(done)); }

    std::vector<CecMessage> seen;
    std::vector<uint8_t> timeouts;

protected:
    void handle_timer_event(uint8_t state) override { timeouts.push_back(state); }

private:
    uint8_t claim_;
    bool start_ok_;
};

struct Rig {
    transport::SimulatedBus bus;
    transport::SimulatedDisplay tv;
    DeviceConfig cfg;
    std::unique_ptr<LocalDevice> dev;

    Rig() {
        bus.attach(tv);
        dev.reset(new LocalDevice(bus, cfg));
    }

    ProbeAction* add_probe(uint8_t target, uint8_t claim, bool start_ok = true) {
        std::unique_ptr<ProbeAction> p(new ProbeAction(*dev, target, claim, start_ok));
        ProbeAction* raw = p.get();
        if (!dev->add_and_start(std::move(p))) return nullptr;
        return raw;
    }
};

static const CecMessage REPORT_ON = build_report_power_status(ADDR_TV, ADDR_PLAYBACK_1, POWER_STATUS_ON);

TEST_CASE("Device exposes its identity and a fresh clock") {
    Rig rig;
    CHECK(rig.dev->logical_address() == ADDR_PLAYBACK_1);
    CHECK(rig.dev->physical_address() == 0x1000);
    CHECK(rig.dev->tick_count() == 0);
    CHECK(rig.dev->uptime_ms() == 0);
    CHECK_FALSE(rig.dev->is_active_source());
    CHECK(rig.dev->routing_port() == LocalDevice::PORT_UNKNOWN);
}

TEST_CASE("tick() advances uptime; backwards time ignored; zero is a valid start") {
    Rig rig;
    rig.dev->tick(0);
    CHECK(rig.dev->uptime_ms() == 0);
    rig.dev->tick(250);
    CHECK(rig.dev->uptime_ms() == 250);
    rig.dev->tick(200);
    CHECK(rig.dev->uptime_ms() == 250);
    rig.dev->tick(1200);
    CHECK(rig.dev->uptime_ms() == 1250);
    CHECK(rig.dev->tick_count() == 4);
}

TEST_CASE("Dispatch walks actions in registration order; first claim wins") {
    Rig rig;
    ProbeAction* a = rig.add_probe(1, OP_STANDBY);
    ProbeAction* b = rig.add_probe(2, OP_REPORT_POWER_STATUS);
    ProbeAction* c = rig.add_probe(3, OP_REPORT_POWER_STATUS);
    REQUIRE(a); REQUIRE(b); REQUIRE(c);

    CHECK(rig.dev->dispatch_message(REPORT_ON));
    CHECK(a->seen.size() == 1);
    CHECK(b->seen.size() == 1);
    CHECK(c->seen.empty());

    CHECK_FALSE(rig.dev->dispatch_message(build_image_view_on(ADDR_TV, ADDR_PLAYBACK_1)));
    CHECK(a->seen.size() == 2);
    CHECK(c->seen.size() == 1);
}

TEST_CASE("Finished actions are skipped and purged after the pass") {
    Rig rig;
    ProbeAction* a = rig.add_probe(1, OP_REPORT_POWER_STATUS);
    ProbeAction* b = rig.add_probe(2, OP_REPORT_POWER_STATUS);
    REQUIRE(a); REQUIRE(b);

    a->finish();
    CHECK(rig.dev->action_count() == 1);
    CHECK(rig.dev->registered_count() == 2);   // still listed until a pass ends

    CHECK(rig.dev->dispatch_message(REPORT_ON));
    CHECK(b->seen.size() == 1);
    CHECK(rig.dev->registered_count() == 1);
}

TEST_CASE("finish() is idempotent and cancel() delivers once") {
    Rig rig;
    std::vector<int> got;
    auto probe = std::unique_ptr<ProbeAction>(new ProbeAction(*rig.dev, 1, OP_STANDBY));
    ProbeAction* p = probe.get();
    REQUIRE(p->add_callback(make_callback([&](int r) { got.push_back(r); })));
    REQUIRE(rig.dev->add_and_start(std::move(probe)));

    p->wait(1000);
    REQUIRE(rig.dev->is_timer_armed(p->id()));

    p->cancel(RESULT_CANCELLED);
    p->cancel(RESULT_FAIL);
    p->finish();
    CHECK(p->is_finished());
    CHECK_FALSE(rig.dev->is_timer_armed(p->id()));
    CHECK(got == std::vector<int>({RESULT_CANCELLED}));
    CHECK_FALSE(p->add_callback(make_callback([](int) {})));

    rig.dev->tick(0);
    CHECK(rig.dev->registered_count() == 0);
}

TEST_CASE("Timers route only to their owner and only for the current occurrence") {
    Rig rig;
    ProbeAction* a = rig.add_probe(1, OP_STANDBY);
    ProbeAction* b = rig.add_probe(2, OP_STANDBY);
    REQUIRE(a); REQUIRE(b);

    a->wait(500);
    const TimerToken old = a->current_token();
    a->wait(500);                                    // re-entered: old occurrence is stale

    CHECK(rig.dev->route_timer(a->id(), old));
    CHECK(a->timeouts.empty());

    rig.dev->tick(0);
    rig.dev->tick(499);
    CHECK(a->timeouts.empty());
    rig.dev->tick(500);
    CHECK(a->timeouts.size() == 1);
    CHECK(b->timeouts.empty());

    const uint32_t id = a->id();
    const TimerToken current = a->current_token();
    a->finish();
    CHECK_FALSE(rig.dev->route_timer(id, current));
}

TEST_CASE("add_incoming filters invalid and foreign messages; inbox is bounded") {
    Rig rig;
    CHECK_FALSE(rig.dev->add_incoming(CecMessage(ADDR_TV, ADDR_PLAYBACK_1, OP_REPORT_POWER_STATUS)));
    CHECK_FALSE(rig.dev->add_incoming(build_report_power_status(ADDR_TV, ADDR_PLAYBACK_2, 0)));
    CHECK(rig.dev->add_incoming(build_active_source(ADDR_TV, 0x0000)));
    CHECK(rig.dev->add_incoming(REPORT_ON));

    for (size_t i = rig.dev->inbox_size(); i < LocalDevice::INBOX_CAP; ++i) {
        REQUIRE(rig.dev->add_incoming(REPORT_ON));
    }
    CHECK_FALSE(rig.dev->add_incoming(REPORT_ON));
}

TEST_CASE("At most one inbound message is dispatched per tick") {
    Rig rig;
    ProbeAction* p = rig.add_probe(1, 0xFF);
    REQUIRE(p);
    rig.bus.inject(REPORT_ON);
    rig.bus.inject(REPORT_ON);
    rig.bus.inject(REPORT_ON);

    rig.dev->tick(0);
    CHECK(p->seen.size() == 1);
    CHECK(rig.dev->inbox_size() == 2);
    rig.dev->tick(10);
    rig.dev->tick(20);
    CHECK(p->seen.size() == 3);
}

TEST_CASE("Send completions reach live actions only") {
    Rig rig;
    rig.bus.set_auto_complete(false);
    ProbeAction* p = rig.add_probe(ADDR_TV, OP_STANDBY);
    REQUIRE(p);

    int calls = 0;
    p->send(build_standby(ADDR_PLAYBACK_1, ADDR_TV), [&](TransportResult) { ++calls; });
    p->send(build_standby(ADDR_PLAYBACK_1, ADDR_TV), [&](TransportResult) { ++calls; });

    CHECK(rig.bus.complete_next(TransportResult::Success));
    CHECK(calls == 1);

    p->finish();
    CHECK(rig.bus.complete_next(TransportResult::Nack));
    CHECK(calls == 1);
}

TEST_CASE("A refused start registers nothing and delivers nothing") {
    Rig rig;
    int calls = 0;
    auto probe = std::unique_ptr<ProbeAction>(new ProbeAction(*rig.dev, 1, OP_STANDBY, false));
    probe->add_callback(make_callback([&](int) { ++calls; }));
    CHECK_FALSE(rig.dev->add_and_start(std::move(probe)));
    CHECK(calls == 0);
    CHECK(rig.dev->action_count() == 0);
    CHECK(rig.dev->registered_count() == 0);
}

TEST_CASE("The registry refuses actions beyond MAX_LIVE_ACTIONS") {
    Rig rig;
    for (size_t i = 0; i < LocalDevice::MAX_LIVE_ACTIONS; ++i) {
        REQUIRE(rig.add_probe(static_cast<uint8_t>(i), OP_STANDBY));
    }
    CHECK(rig.add_probe(9, OP_STANDBY) == nullptr);

    int calls = 0;
    CHECK_FALSE(rig.dev->standby(ADDR_TV, make_callback([&](int) { ++calls; })));
    CHECK(calls == 0);
}

TEST_CASE("Operations refuse a null callback") {
    Rig rig;
    CHECK_FALSE(rig.dev->one_touch_play(nullptr));
    CHECK_FALSE(rig.dev->standby(ADDR_TV, nullptr));
    CHECK_FALSE(rig.dev->query_display_status(nullptr));
    CHECK(rig.bus.sent().empty());
}

TEST_CASE("clear_actions cancels every live action with one result") {
    Rig rig;
    std::vector<int> got;
    auto cb = make_callback([&](int r) { got.push_back(r); });
    REQUIRE(rig.dev->one_touch_play(cb));
    REQUIRE(rig.dev->standby(ADDR_AUDIO_SYSTEM, cb));

    CHECK(rig.dev->clear_actions() == 2);
    CHECK(got == std::vector<int>({RESULT_CANCELLED, RESULT_CANCELLED}));
    CHECK(rig.dev->action_count() == 0);
    CHECK(rig.dev->registered_count() == 0);

    uint64_t next = 0;
    CHECK_FALSE(rig.dev->next_timer_deadline(next));
}

TEST_CASE("A callback may start a new operation on the same device") {
    Rig rig;
    rig.bus.set_send_result(OP_STANDBY, TransportResult::Nack);
    int status = -2;
    auto query = make_callback([&](int r) { status = r; });

    REQUIRE(rig.dev->standby(ADDR_TV, make_callback([&](int) {
        CHECK(rig.dev->query_display_status(query));
    })));

    for (uint32_t t = 0; t <= 300; t += 10) rig.dev->tick(t);
    CHECK(status == POWER_STATUS_STANDBY);
}

TEST_CASE("A callback that throws is isolated from the others") {
    std::ostringstream sink;
    set_log_sink(&sink);

    Rig rig;
    rig.bus.set_send_result(OP_STANDBY, TransportResult::Busy);
    int second = -1;
    REQUIRE(rig.dev->standby(ADDR_TV, make_callback([](int) { throw std::runtime_error("caller gone"); })));
    REQUIRE(rig.dev->standby(ADDR_TV, make_callback([&](int r) { second = r; })));

    rig.dev->tick(0);
    CHECK(second == RESULT_BUSY);
    CHECK(rig.dev->action_count() == 0);
    CHECK(sink.str().find("event=callback_failed") != std::string::npos);

    set_log_sink(nullptr);
}

TEST_CASE("A callback throwing a non-standard value still lets the next caller finish") {
    std::ostringstream sink;
    set_log_sink(&sink);

    Rig rig;
    rig.bus.set_send_result(OP_STANDBY, TransportResult::Nack);
    int second = -1;
    REQUIRE(rig.dev->standby(ADDR_TV, make_callback([](int) { throw 42; })));
    REQUIRE(rig.dev->standby(ADDR_TV, make_callback([&](int r) { second = r; })));

    CHECK_NOTHROW(rig.dev->tick(0));
    CHECK(second == RESULT_NACK);
    CHECK(rig.dev->action_count() == 0);
    CHECK(rig.dev->registered_count() == 0);
    CHECK(sink.str().find("what=unknown") != std::string::npos);

    set_log_sink(nullptr);
}

TEST_CASE("An action delivering its result no longer holds a registry slot") {
    Rig rig;
    rig.bus.set_auto_complete(false);

    bool started = false;
    size_t live_seen = 0;
    int status = -2;
    auto query = make_callback([&](int r) { status = r; });

    REQUIRE(rig.dev->standby(1, make_callback([&](int) {
        live_seen = rig.dev->action_count();
        started = rig.dev->query_display_status(query);
    })));
    for (uint8_t t = 2; t < 2 + LocalDevice::MAX_LIVE_ACTIONS - 1; ++t) {
        REQUIRE(rig.dev->standby(t, make_callback([](int) {})));
    }
    REQUIRE(rig.dev->action_count() == LocalDevice::MAX_LIVE_ACTIONS);

    REQUIRE(rig.bus.complete_next(TransportResult::Busy));   // first standby fails
    CHECK(live_seen == LocalDevice::MAX_LIVE_ACTIONS - 1);
    CHECK(started);
    CHECK(rig.dev->action_count() == LocalDevice::MAX_LIVE_ACTIONS);
    CHECK(rig.dev->has_action(ActionKind::PowerStatus));
}

TEST_CASE("clear_actions from a delivering callback counts only the others") {
    Rig rig;
    rig.bus.set_auto_complete(false);

    size_t cleared = 99;
    int other = -1;
    REQUIRE(rig.dev->standby(1, make_callback([&](int) { cleared = rig.dev->clear_actions(); })));
    REQUIRE(rig.dev->standby(2, make_callback([&](int r) { other = r; })));

    REQUIRE(rig.bus.complete_next(TransportResult::Fail));
    CHECK(cleared == 1);
    CHECK(other == RESULT_CANCELLED);
    CHECK(rig.dev->action_count() == 0);
}
