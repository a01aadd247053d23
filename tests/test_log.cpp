#include <doctest/doctest.h>
#include <sstream>
#include "cecflow/log.hpp"

using namespace cecflow;

TEST_CASE("Log lines are key=value with the level first") {
    std::ostringstream sink;
    set_log_sink(&sink);
    set_log_level(LogLevel::Info);

    log_info("action=standby id=", 3, " event=no_ack");
    CHECK(sink.str() == "level=info action=standby id=3 event=no_ack\n");

    set_log_sink(nullptr);
}

TEST_CASE("Lines below the threshold are dropped") {
    std::ostringstream sink;
    set_log_sink(&sink);

    set_log_level(LogLevel::Warn);
    log_debug("a=1");
    log_info("b=2");
    log_warn("c=3");
    log_error("d=4");
    CHECK(sink.str() == "level=warn c=3\nlevel=error d=4\n");

    set_log_level(LogLevel::Off);
    log_error("e=5");
    CHECK(sink.str() == "level=warn c=3\nlevel=error d=4\n");

    set_log_level(LogLevel::Info);
    set_log_sink(nullptr);
}

TEST_CASE("Threshold can be set by name") {
    CHECK(set_log_level(std::string("debug")));
    CHECK(log_level() == LogLevel::Debug);
    CHECK_FALSE(set_log_level(std::string("loud")));
    CHECK(log_level() == LogLevel::Debug);
    set_log_level(LogLevel::Info);
}
