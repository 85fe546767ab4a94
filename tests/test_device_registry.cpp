#include <catch2/catch_test_macros.hpp>
#include <backplane/DeviceRegistry.hpp>

#include <stdexcept>

using namespace backplane;

TEST_CASE("DeviceRegistry ids", "[devices][registry]") {
    DeviceRegistry registry;

    SECTION("Generated ids start at 1 and increase") {
        REQUIRE(registry.generate_id() == 1);
        REQUIRE(registry.generate_id() == 2);
    }

    SECTION("Registered devices can be looked up") {
        const uint32_t id = registry.generate_id();
        registry.register_device(id, "keyboard", "Keyboard", "motherboard");
        REQUIRE(registry.contains(id));
        REQUIRE(registry.get(id).wiring_path == "motherboard");
        REQUIRE(registry.find(id)->kind == "keyboard");
        REQUIRE(registry.find(99) == nullptr);
        REQUIRE_THROWS_AS(registry.get(99), std::out_of_range);
    }

    SECTION("Id 0 and duplicates are rejected") {
        REQUIRE_THROWS_AS(registry.register_device(0, "ram", "RAM", "motherboard"), std::invalid_argument);
        registry.register_device(5, "ram", "RAM", "motherboard");
        REQUIRE_THROWS_AS(registry.register_device(5, "rom", "ROM", "motherboard"), std::invalid_argument);
    }

    SECTION("Explicit ids move the generator past them") {
        registry.register_device(10, "rom_card", "Disk", "slot/6");
        REQUIRE(registry.generate_id() == 11);
    }

    SECTION("Listing is ordered by id") {
        registry.register_device(3, "c", "C", "motherboard");
        registry.register_device(1, "a", "A", "motherboard");
        registry.register_device(2, "b", "B", "slot/1");
        const auto devices = registry.devices();
        REQUIRE(registry.count() == 3);
        REQUIRE(devices[0].kind == "a");
        REQUIRE(devices[2].kind == "c");
    }
}
