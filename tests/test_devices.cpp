#include <catch2/catch_test_macros.hpp>
#include <backplane/EventContext.hpp>
#include <backplane/IoPageDispatcher.hpp>
#include <backplane/MemoryBus.hpp>
#include <backplane/Scheduler.hpp>
#include <backplane/SignalBus.hpp>
#include <backplane/SlotManager.hpp>
#include <backplane/devices/IoPage.hpp>
#include <backplane/devices/KeyboardController.hpp>
#include <backplane/devices/RomCard.hpp>
#include <backplane/devices/SpeakerController.hpp>

#include "TestSupport.hpp"

#include <stdexcept>
#include <vector>

using namespace backplane;
using namespace backplane::test;

namespace {

struct DeviceFixture {
    MemoryBus bus;
    Scheduler scheduler;
    SignalBus signals;
    EventContext context{scheduler, signals, bus};
    IoPageDispatcher io;
    SlotManager slots{io};
    IoPageTarget page{io, slots};

    DeviceFixture() {
        scheduler.set_event_context(context);
        bus.set_clock(&scheduler);
        bus.map_page(0xC, entry_for(page, PagePerms::All, RegionTag::Io, 2));
    }
};

} // namespace

TEST_CASE("KeyboardController latch and strobe", "[devices][keyboard]") {
    DeviceFixture f;
    KeyboardController keyboard(f.io);
    keyboard.initialize(f.context);

    SECTION("Nothing typed") {
        REQUIRE(f.bus.read8(0xC000) == 0x00);
    }

    SECTION("A key sets the strobe bit") {
        keyboard.key_down('A');
        REQUIRE(f.bus.read8(0xC000) == 0xC1);
        REQUIRE(f.bus.read8(0xC00F) == 0xC1);
    }

    SECTION("Lower case is folded to upper case") {
        keyboard.key_down('q');
        REQUIRE(keyboard.latch() == 'Q');
    }

    SECTION("Reading $C010 clears the strobe") {
        keyboard.key_down('A');
        REQUIRE(f.bus.read8(0xC010) == 0xC1);
        REQUIRE(f.bus.read8(0xC000) == 0x41);
        REQUIRE_FALSE(keyboard.strobe());
    }

    SECTION("Writing $C010 clears the strobe") {
        keyboard.key_down('A');
        f.bus.write8(0xC01F, 0x00);
        REQUIRE_FALSE(keyboard.strobe());
    }

    SECTION("Peeking $C010 leaves the strobe alone") {
        keyboard.key_down('A');
        REQUIRE(f.bus.peek(0xC010) == 0xC1);
        REQUIRE(keyboard.strobe());
    }

    SECTION("The keyboard claims $C000-$C01F only") {
        REQUIRE(f.io.has_read_handler(0x00));
        REQUIRE(f.io.has_read_handler(0x1F));
        REQUIRE_FALSE(f.io.has_read_handler(0x20));
        REQUIRE_FALSE(f.io.has_write_handler(0x00));
    }
}

TEST_CASE("KeyboardController scheduled typing", "[devices][keyboard][scheduler]") {
    DeviceFixture f;
    KeyboardController keyboard(f.io);

    SECTION("Typing before initialization is an error") {
        REQUIRE_THROWS_AS(keyboard.type_text("HI"), std::logic_error);
    }

    keyboard.initialize(f.context);

    SECTION("One key per interval, newlines as carriage returns") {
        keyboard.type_text("HI\n", 100);
        REQUIRE(keyboard.pending_keys() == 3);

        f.scheduler.advance(99);
        REQUIRE_FALSE(keyboard.strobe());

        f.scheduler.advance(1);
        REQUIRE(keyboard.latch() == 'H');

        f.scheduler.advance(100);
        REQUIRE(keyboard.latch() == 'I');

        f.scheduler.advance(100);
        REQUIRE(keyboard.latch() == 0x0D);
        REQUIRE(keyboard.pending_keys() == 0);
    }

    SECTION("Reset cancels pending keystrokes") {
        keyboard.type_text("HELLO", 100);
        f.scheduler.advance(100);
        keyboard.reset();
        REQUIRE(keyboard.pending_keys() == 0);
        REQUIRE(f.scheduler.pending_count() == 0);
        f.scheduler.advance(1000);
        REQUIRE(keyboard.latch() == 0);
    }
}

TEST_CASE("SpeakerController toggles", "[devices][speaker]") {
    DeviceFixture f;
    SpeakerController speaker(f.io);

    SECTION("Every access to $C030-$C03F flips the cone") {
        f.scheduler.advance(10);
        f.bus.read8(0xC030);
        f.scheduler.advance(5);
        f.bus.write8(0xC03F, 0x00);

        REQUIRE(speaker.toggle_count() == 2);
        REQUIRE_FALSE(speaker.state());
        REQUIRE(speaker.toggles().size() == 2);
        REQUIRE(speaker.toggles()[0].cycle == 10);
        REQUIRE(speaker.toggles()[0].state);
        REQUIRE(speaker.toggles()[1].cycle == 15);
    }

    SECTION("Peeking does not toggle") {
        f.bus.peek(0xC030);
        REQUIRE(speaker.toggle_count() == 0);
    }

    SECTION("Taking toggles empties the record") {
        f.bus.read8(0xC030);
        REQUIRE(speaker.take_toggles().size() == 1);
        REQUIRE(speaker.toggles().empty());
        REQUIRE(speaker.toggle_count() == 1);
    }

    SECTION("Reset returns to rest") {
        f.bus.read8(0xC030);
        speaker.reset();
        REQUIRE_FALSE(speaker.state());
        REQUIRE(speaker.toggle_count() == 0);
    }
}

TEST_CASE("RomCard images", "[devices][rom_card]") {
    SECTION("Short images are padded with $FF") {
        const std::vector<uint8_t> slot_rom{0xA9, 0x00};
        RomCard card("Test", slot_rom);
        BusAccess access = BusAccess::data_read(0);
        REQUIRE(card.slot_rom()->read8(0x00, access) == 0xA9);
        REQUIRE(card.slot_rom()->read8(0x02, access) == 0xFF);
        REQUIRE(card.expansion_rom() == nullptr);
    }

    SECTION("Expansion ROM is optional") {
        const std::vector<uint8_t> slot_rom(0x100, 0x11);
        const std::vector<uint8_t> expansion(0x800, 0x22);
        RomCard card("Test", slot_rom, expansion);
        REQUIRE(card.expansion_rom() != nullptr);
        REQUIRE(card.expansion_rom()->read8(0x7FF, BusAccess::data_read(0)) == 0x22);
    }

    SECTION("Empty and oversized images are rejected") {
        const std::vector<uint8_t> empty;
        const std::vector<uint8_t> big(0x101, 0);
        const std::vector<uint8_t> slot_rom(0x100, 0);
        const std::vector<uint8_t> big_expansion(0x801, 0);
        REQUIRE_THROWS_AS(RomCard("Test", empty), std::invalid_argument);
        REQUIRE_THROWS_AS(RomCard("Test", big), std::invalid_argument);
        REQUIRE_THROWS_AS(RomCard("Test", slot_rom, big_expansion), std::invalid_argument);
    }

    SECTION("Selection notifications and reset") {
        const std::vector<uint8_t> slot_rom(0x100, 0);
        RomCard card("Test", slot_rom);
        card.on_expansion_rom_selected();
        REQUIRE(card.expansion_selected());
        card.reset();
        REQUIRE_FALSE(card.expansion_selected());
        REQUIRE(card.kind() == PeripheralKind::SlotCard);
        REQUIRE(card.device_type() == "rom_card");
    }
}
