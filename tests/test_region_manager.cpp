#include <catch2/catch_test_macros.hpp>
#include <backplane/MemoryBus.hpp>
#include <backplane/PhysicalMemory.hpp>
#include <backplane/RegionManager.hpp>

#include "TestSupport.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace backplane;
using namespace backplane::test;

namespace {

std::shared_ptr<MemoryRegion> device_region(std::string id, Addr base, uint32_t size, int priority,
                                            std::shared_ptr<BusTarget> target) {
    auto region = std::make_shared<MemoryRegion>();
    region->id = std::move(id);
    region->name = region->id;
    region->preferred_base = base;
    region->size = size;
    region->tag = RegionTag::Io;
    region->default_perms = PagePerms::ReadWrite;
    region->target = std::move(target);
    region->priority = priority;
    return region;
}

const MemoryRegionDescriptor& described(const std::vector<MemoryRegionDescriptor>& all, const std::string& id) {
    auto it = std::find_if(all.begin(), all.end(), [&](const auto& d) { return d.id == id; });
    REQUIRE(it != all.end());
    return *it;
}

} // namespace

TEST_CASE("RegionManager registration", "[region]") {
    RegionManager manager;
    PhysicalMemory ram(0x4000, "RAM");

    SECTION("Registered regions are listed by priority") {
        manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram, 5));
        manager.register_region(device_region("io", 0xC000, 0x1000, 0, std::make_shared<RecordingTarget>()));
        const auto regions = manager.regions();
        REQUIRE(regions.size() == 2);
        REQUIRE(regions[0]->id == "io");
        REQUIRE(regions[1]->id == "ram");
        REQUIRE(manager.region("ram")->size == 0x4000);
        REQUIRE(manager.region("missing") == nullptr);
    }

    SECTION("Duplicates and nulls are rejected") {
        manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram));
        REQUIRE_THROWS_AS(manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(manager.register_region(nullptr), std::invalid_argument);
    }

    SECTION("Range queries use the preferred range") {
        manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram));
        REQUIRE(manager.regions_in_range(0x3FFF, 1).size() == 1);
        REQUIRE(manager.regions_in_range(0x4000, 0x1000).empty());
    }

    SECTION("Unregistering removes the mapping") {
        MemoryBus bus;
        manager.attach(bus);
        manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram));
        manager.map_region("ram");
        REQUIRE(bus.page(0).is_mapped());
        REQUIRE(manager.unregister_region("ram"));
        REQUIRE_FALSE(bus.page(0).is_mapped());
        REQUIRE_FALSE(manager.unregister_region("ram"));
    }
}

TEST_CASE("RegionManager mapping drives the page table", "[region][page]") {
    MemoryBus bus;
    RegionManager manager;
    manager.attach(bus);

    PhysicalMemory ram(0x10000, "RAM");
    PhysicalMemory rom(0x1000, "ROM");
    rom.fill(0xEA);
    manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram, 1));
    manager.register_region(MemoryRegion::rom("rom", "ROM", 0xF000, rom, 0));

    SECTION("Lower priority value wins where regions overlap") {
        manager.map_region("ram");
        manager.map_region("rom");
        REQUIRE(bus.page(0xF).tag == RegionTag::Rom);
        REQUIRE(bus.page(0xE).tag == RegionTag::Ram);
        REQUIRE(bus.read8(0xF000) == 0xEA);
    }

    SECTION("Mapping order does not matter") {
        manager.map_region("rom");
        manager.map_region("ram");
        REQUIRE(bus.page(0xF).tag == RegionTag::Rom);
    }

    SECTION("Deactivating the ROM exposes RAM beneath") {
        manager.map_region("ram");
        manager.map_region("rom");
        REQUIRE(manager.deactivate("rom"));
        REQUIRE(bus.page(0xF).tag == RegionTag::Ram);
        REQUIRE(manager.activate("rom"));
        REQUIRE(bus.page(0xF).tag == RegionTag::Rom);
    }

    SECTION("A region maps once, at its preferred base unless relocatable") {
        manager.map_region("ram");
        REQUIRE_THROWS_AS(manager.map_region("ram"), std::invalid_argument);
        REQUIRE_THROWS_AS(manager.map_region_at("rom", 0xE000), std::invalid_argument);
        REQUIRE_THROWS_AS(manager.map_region("missing"), std::invalid_argument);
    }

    SECTION("Permission overrides reach the page table") {
        manager.map_region("rom");
        REQUIRE(manager.set_region_perms("rom", PagePerms::All));
        REQUIRE(bus.page(0xF).perms == PagePerms::All);
        REQUIRE_FALSE(manager.set_region_perms("ram", PagePerms::All));
    }

    SECTION("Late attach builds the whole table") {
        manager.map_region("ram");
        manager.map_region("rom");
        MemoryBus other;
        manager.attach(other);
        REQUIRE(other.page(0x0).tag == RegionTag::Ram);
        REQUIRE(other.page(0xF).tag == RegionTag::Rom);
    }
}

TEST_CASE("RegionManager bank switching", "[region][bank]") {
    MemoryBus bus;
    RegionManager manager;
    manager.attach(bus);
    auto bank1 = std::make_shared<RecordingTarget>();
    auto bank2 = std::make_shared<RecordingTarget>();
    manager.register_region(device_region("bank1", 0xD000, 0x1000, 0, bank1));
    manager.register_region(device_region("bank2", 0xD000, 0x1000, 0, bank2));
    manager.map_region("bank1", true);
    manager.map_region("bank2", false);

    REQUIRE(manager.mapping_stack_count() == 1);
    REQUIRE(bus.page(0xD).target == bank1.get());

    SECTION("Switching flips which bank is visible") {
        REQUIRE(manager.switch_bank("bank1", "bank2"));
        REQUIRE(bus.page(0xD).target == bank2.get());
        REQUIRE(manager.switch_bank("bank2", "bank1"));
        REQUIRE(bus.page(0xD).target == bank1.get());
    }

    SECTION("Switching to an unknown bank changes nothing") {
        REQUIRE_FALSE(manager.switch_bank("bank1", "bank3"));
        REQUIRE(bus.page(0xD).target == bank1.get());
    }

    SECTION("Snapshots restore active flags and permissions") {
        const RegionSnapshot saved = manager.snapshot();
        manager.switch_bank("bank1", "bank2");
        manager.set_region_perms("bank2", PagePerms::Read);
        manager.restore(saved);
        REQUIRE(bus.page(0xD).target == bank1.get());
        REQUIRE(bus.page(0xD).perms == PagePerms::ReadWrite);
    }

    SECTION("Snapshots of a different shape are rejected") {
        RegionSnapshot saved = manager.snapshot();
        saved.entries.pop_back();
        REQUIRE_THROWS_AS(manager.restore(saved), std::invalid_argument);
    }

    SECTION("Descriptors mark the visible bank active") {
        const auto all = manager.describe();
        REQUIRE(has_flag(described(all, "bank1").flags, RegionFlags::Active));
        REQUIRE_FALSE(has_flag(described(all, "bank2").flags, RegionFlags::Active));
        REQUIRE(has_flag(described(all, "bank2").flags, RegionFlags::Writable));
    }
}

TEST_CASE("RegionManager placement", "[region][layout]") {
    RegionManager manager;
    PhysicalMemory ram(0x10000, "RAM");
    PhysicalMemory rom(0x1000, "ROM");

    SECTION("64KB RAM and a 4KB ROM at $F000 cover the space with no gaps") {
        MemoryBus bus;
        manager.attach(bus);
        manager.register_region(MemoryRegion::ram("ram", "RAM", 0x0000, ram, 1));
        manager.register_region(MemoryRegion::rom("rom", "ROM", 0xF000, rom, 0));

        const auto placements = manager.place_regions();
        REQUIRE(placements.size() == 2);
        REQUIRE(placements[0].region_id == "rom");
        REQUIRE_FALSE(placements[1].relocated);

        for (uint32_t page = 0; page < 0xF; ++page) {
            REQUIRE(bus.page(page).tag == RegionTag::Ram);
        }
        REQUIRE(bus.page(0xF).tag == RegionTag::Rom);
    }

    SECTION("Relocatable regions move to the nearest free range, downwards first") {
        auto fixed = device_region("fixed", 0x8000, 0x2000, 0, std::make_shared<RecordingTarget>());
        auto mover = device_region("mover", 0x9000, 0x1000, 1, std::make_shared<RecordingTarget>());
        mover->relocatable = true;
        manager.register_region(fixed);
        manager.register_region(mover);

        const auto placements = manager.place_regions();
        REQUIRE(placements[1].region_id == "mover");
        REQUIRE(placements[1].relocated);
        REQUIRE(placements[1].base == 0x7000);
        REQUIRE(manager.mapped_base("mover") == Addr{0x7000});
    }

    SECTION("A fixed region that collides is a layout error") {
        manager.register_region(device_region("a", 0x8000, 0x2000, 0, std::make_shared<RecordingTarget>()));
        manager.register_region(device_region("b", 0x9000, 0x1000, 1, std::make_shared<RecordingTarget>()));
        REQUIRE_THROWS_AS(manager.place_regions(), LayoutError);
    }

    SECTION("Misaligned or oversized regions are layout errors") {
        manager.register_region(device_region("odd", 0x8800, 0x1000, 0, std::make_shared<RecordingTarget>()));
        REQUIRE_THROWS_AS(manager.place_regions(), LayoutError);
    }

    SECTION("Regions past the end of the space are layout errors") {
        RegionManager small(16);
        small.register_region(device_region("far", 0xF000, 0x2000, 0, std::make_shared<RecordingTarget>()));
        REQUIRE_THROWS_AS(small.place_regions(), LayoutError);
    }
}
