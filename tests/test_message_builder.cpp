#include <doctest/doctest.h>
#include "cecflow/message_builder.hpp"

using namespace cecflow;

TEST_CASE("Builders produce valid messages with the right shape") {
    CecMessage tvo = build_text_view_on(ADDR_PLAYBACK_1, ADDR_TV);
    CHECK(tvo.valid());
    CHECK(tvo.opcode() == OP_TEXT_VIEW_ON);
    CHECK(tvo.params().empty());

    CecMessage ivo = build_image_view_on(ADDR_PLAYBACK_1, ADDR_TV);
    CHECK(ivo.valid());
    CHECK(ivo.opcode() == OP_IMAGE_VIEW_ON);

    CecMessage q = build_give_device_power_status(ADDR_PLAYBACK_1, ADDR_TV);
    CHECK(q.valid());
    CHECK(q.destination() == ADDR_TV);

    CecMessage sb = build_standby(ADDR_PLAYBACK_1, ADDR_BROADCAST);
    CHECK(sb.valid());
    CHECK(sb.is_broadcast());
}

TEST_CASE("Active Source is a broadcast carrying the physical address big endian") {
    CecMessage as = build_active_source(ADDR_PLAYBACK_1, 0x1200);
    REQUIRE(as.valid());
    CHECK(as.is_broadcast());
    CHECK(as.source() == ADDR_PLAYBACK_1);
    REQUIRE(as.params().size() == 2);
    CHECK(as.params()[0] == 0x12);
    CHECK(as.params()[1] == 0x00);
}

TEST_CASE("Report Power Status carries one status byte") {
    CecMessage r = build_report_power_status(ADDR_TV, ADDR_PLAYBACK_1, POWER_STATUS_TRANSIENT_TO_ON);
    REQUIRE(r.valid());
    CHECK(r.params()[0] == POWER_STATUS_TRANSIENT_TO_ON);
}

TEST_CASE("describe() renders a one-line summary") {
    CHECK(describe(build_text_view_on(4, 0)) == "src=4 dst=0 op=text_view_on params=");
    CHECK(describe(build_active_source(4, 0x1000)) == "src=4 dst=15 op=active_source params=10:00");
    CHECK(opcode_name(0x47) == "0x47");
}

TEST_CASE("parse_hex_frame reads cec-ctl style frames") {
    CecMessage m;
    std::string err;

    REQUIRE(parse_hex_frame("40:04", m, err));
    CHECK(m == build_image_view_on(4, 0));

    REQUIRE(parse_hex_frame("4f 82 10 00", m, err));
    CHECK(m == build_active_source(4, 0x1000));

    REQUIRE(parse_hex_frame("4f-82-1-0", m, err));
    CHECK(m.params()[0] == 0x01);
}

TEST_CASE("parse_hex_frame reports stable errors") {
    CecMessage m;
    std::string err;

    CHECK_FALSE(parse_hex_frame("", m, err));
    CHECK(err == "empty");

    CHECK_FALSE(parse_hex_frame("40:0g", m, err));
    CHECK(err == "bad_hex");

    CHECK_FALSE(parse_hex_frame("400:04", m, err));
    CHECK(err == "bad_hex");

    CHECK_FALSE(parse_hex_frame("04:90", m, err));      // report without status
    CHECK(err == "invalid_message");

    CHECK_FALSE(parse_hex_frame("40", m, err));
    CHECK(err == "invalid_message");
}
