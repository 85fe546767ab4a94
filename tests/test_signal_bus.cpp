#include <catch2/catch_test_macros.hpp>
#include <backplane/SignalBus.hpp>

using namespace backplane;

TEST_CASE("SignalBus wired-OR lines", "[signal]") {
    SignalBus signals;

    SECTION("A line is asserted while anyone holds it") {
        REQUIRE(signals.assert_line(SignalLine::Irq, 3));
        REQUIRE(signals.assert_line(SignalLine::Irq, 4));
        REQUIRE(signals.asserter_count(SignalLine::Irq) == 2);

        REQUIRE(signals.clear_line(SignalLine::Irq, 3));
        REQUIRE(signals.is_asserted(SignalLine::Irq));
        REQUIRE(signals.clear_line(SignalLine::Irq, 4));
        REQUIRE_FALSE(signals.is_asserted(SignalLine::Irq));
    }

    SECTION("Asserting twice is idempotent") {
        REQUIRE(signals.assert_line(SignalLine::Irq, 3));
        REQUIRE_FALSE(signals.assert_line(SignalLine::Irq, 3));
        REQUIRE(signals.asserter_count(SignalLine::Irq) == 1);
    }

    SECTION("A device can only release what it asserted") {
        signals.assert_line(SignalLine::Irq, 3);
        REQUIRE_FALSE(signals.clear_line(SignalLine::Irq, 4));
        REQUIRE(signals.is_asserted_by(SignalLine::Irq, 3));
        REQUIRE_FALSE(signals.is_asserted_by(SignalLine::Irq, 4));
    }

    SECTION("Lines are independent") {
        signals.assert_line(SignalLine::Rdy, 1);
        REQUIRE_FALSE(signals.is_asserted(SignalLine::Irq));
        REQUIRE(signals.is_asserted(SignalLine::Rdy));
    }

    SECTION("release_all drops every line a device holds") {
        signals.assert_line(SignalLine::Irq, 7);
        signals.assert_line(SignalLine::DmaReq, 7);
        signals.assert_line(SignalLine::Irq, 8);
        signals.release_all(7);
        REQUIRE(signals.asserter_count(SignalLine::Irq) == 1);
        REQUIRE_FALSE(signals.is_asserted(SignalLine::DmaReq));
    }

    SECTION("Reset releases everything") {
        signals.assert_line(SignalLine::Irq, 1);
        signals.assert_line(SignalLine::Nmi, 2);
        signals.reset();
        REQUIRE_FALSE(signals.is_asserted(SignalLine::Irq));
        REQUIRE_FALSE(signals.consume_nmi_edge());
    }
}

TEST_CASE("SignalBus NMI is edge triggered", "[signal][nmi]") {
    SignalBus signals;

    REQUIRE_FALSE(signals.consume_nmi_edge());

    signals.assert_line(SignalLine::Nmi, 1);
    signals.assert_line(SignalLine::Nmi, 2);
    REQUIRE(signals.consume_nmi_edge());
    REQUIRE_FALSE(signals.consume_nmi_edge());

    // Still held by device 2: no new edge
    signals.clear_line(SignalLine::Nmi, 1);
    signals.assert_line(SignalLine::Nmi, 1);
    REQUIRE_FALSE(signals.consume_nmi_edge());

    signals.clear_line(SignalLine::Nmi, 1);
    signals.clear_line(SignalLine::Nmi, 2);
    signals.assert_line(SignalLine::Nmi, 3);
    REQUIRE(signals.consume_nmi_edge());
    REQUIRE(to_string(SignalLine::Nmi) == "NMI");
}
