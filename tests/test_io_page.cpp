#include <catch2/catch_test_macros.hpp>
#include <backplane/IoPageDispatcher.hpp>
#include <backplane/MemoryBus.hpp>
#include <backplane/SlotManager.hpp>
#include <backplane/devices/IoPage.hpp>
#include <backplane/devices/RomCard.hpp>

#include "TestSupport.hpp"

#include <vector>

using namespace backplane;
using namespace backplane::test;

namespace {

std::vector<uint8_t> image(std::size_t size, uint8_t first) {
    std::vector<uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>(first + i);
    }
    return bytes;
}

struct IoPageFixture {
    MemoryBus bus;
    IoPageDispatcher io;
    SlotManager slots{io};
    IoPageTarget page{io, slots};
    RomCard disk{"Disk", image(0x100, 0x20), image(0x800, 0x60)};
    RomCard serial{"Serial", image(0x100, 0x80), image(0x800, 0xA0)};

    IoPageFixture() {
        bus.map_page(0xC, entry_for(page, PagePerms::All, RegionTag::Io, 2));
        slots.install(6, disk);
        slots.install(2, serial);
    }
};

} // namespace

TEST_CASE("IoPageTarget routes the I/O page", "[io]") {
    IoPageFixture f;

    SECTION("Soft switches go to the dispatcher") {
        f.io.register_read(0x30, [](uint8_t, const BusAccess&) { return uint8_t{0x5A}; });
        REQUIRE(f.bus.read8(0xC030) == 0x5A);
        REQUIRE(f.bus.read8(0xC031) == kFloatingBus);
    }

    SECTION("Slot ROMs appear at $Cn00") {
        REQUIRE(f.bus.read8(0xC600) == 0x20);
        REQUIRE(f.bus.read8(0xC601) == 0x21);
        REQUIRE(f.bus.read8(0xC200) == 0x80);
    }

    SECTION("Empty slots float") {
        REQUIRE(f.bus.read8(0xC300) == kFloatingBus);
        REQUIRE(f.bus.try_read(BusAccess::data_read(0xC300)).fault.kind == FaultKind::Unmapped);
    }

    SECTION("Sub-region tags") {
        REQUIRE(f.page.sub_region_tag(0x030) == RegionTag::Io);
        REQUIRE(f.page.sub_region_tag(0x600) == RegionTag::Slot);
    }
}

TEST_CASE("IoPageTarget expansion ROM window", "[io][expansion]") {
    IoPageFixture f;

    SECTION("Nothing selected: $C800 floats") {
        REQUIRE(f.bus.read8(0xC800) == kFloatingBus);
    }

    SECTION("Touching $C6xx selects slot 6's expansion ROM") {
        f.bus.read8(0xC6FF);
        REQUIRE(f.slots.active_expansion_slot() == 6);
        REQUIRE(f.disk.expansion_selected());
        REQUIRE(f.bus.read8(0xC800) == 0x60);
        REQUIRE(f.bus.read8(0xC801) == 0x61);
    }

    SECTION("Writes to $Cnxx select too") {
        f.bus.write8(0xC200, 0x00);
        REQUIRE(f.slots.active_expansion_slot() == 2);
        REQUIRE(f.bus.read8(0xC800) == 0xA0);
    }

    SECTION("Switching slots swaps the window") {
        f.bus.read8(0xC600);
        f.bus.read8(0xC200);
        REQUIRE_FALSE(f.disk.expansion_selected());
        REQUIRE(f.serial.expansion_selected());
        REQUIRE(f.bus.read8(0xC800) == 0xA0);
    }

    SECTION("$CFFF deselects") {
        f.bus.read8(0xC600);
        f.bus.read8(0xCFFF);
        REQUIRE_FALSE(f.slots.active_expansion_slot().has_value());
        REQUIRE_FALSE(f.disk.expansion_selected());
        REQUIRE(f.bus.read8(0xC800) == kFloatingBus);
    }

    SECTION("$CFFF with nothing selected is harmless") {
        REQUIRE(f.bus.read8(0xCFFF) == kFloatingBus);
        f.bus.write8(0xCFFF, 0x00);
        REQUIRE_FALSE(f.slots.active_expansion_slot().has_value());
    }

    SECTION("Side-effect-free accesses never select or deselect") {
        REQUIRE(f.bus.peek(0xC600) == 0x20);
        REQUIRE_FALSE(f.slots.active_expansion_slot().has_value());

        f.bus.read8(0xC600);
        REQUIRE(f.bus.peek(0xCFFF) == 0x5F);
        REQUIRE(f.slots.active_expansion_slot() == 6);
    }

    SECTION("Slot and expansion ROMs ignore writes") {
        f.bus.read8(0xC600);
        f.bus.write8(0xC800, 0xFF);
        f.bus.write8(0xC600, 0xFF);
        REQUIRE(f.bus.read8(0xC800) == 0x60);
        REQUIRE(f.bus.read8(0xC600) == 0x20);
    }
}
