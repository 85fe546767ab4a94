#include <catch2/catch_test_macros.hpp>
#include <backplane/PhysicalMemory.hpp>

#include <array>
#include <stdexcept>

using namespace backplane;

TEST_CASE("PhysicalMemory storage", "[physical]") {
    PhysicalMemory memory(0x3000, "Main RAM");

    SECTION("Starts zeroed") {
        REQUIRE(memory.size() == 0x3000);
        REQUIRE(memory.name() == "Main RAM");
        for (uint8_t byte : memory.data()) {
            REQUIRE(byte == 0);
        }
    }

    SECTION("Slices share the storage") {
        auto view = memory.slice(0x100, 0x10);
        view[0] = 0xAB;
        REQUIRE(memory.data()[0x100] == 0xAB);
        REQUIRE(memory.read_only_slice(0x100, 1)[0] == 0xAB);
    }

    SECTION("Slices beyond the end are rejected") {
        REQUIRE_THROWS_AS(memory.slice(0x2FFF, 2), std::out_of_range);
        REQUIRE_THROWS_AS(memory.read_only_slice(0x3000, 1), std::out_of_range);
        REQUIRE_NOTHROW(memory.slice(0x3000, 0));
    }

    SECTION("Pages") {
        REQUIRE(memory.page_count() == 3);
        REQUIRE(memory.slice_page(2).size() == 0x1000);
        REQUIRE(memory.slice_page(2).data() == memory.slice(0x2000, 1).data());
        REQUIRE_THROWS_AS(memory.slice_page(3), std::out_of_range);
    }

    SECTION("Partial last page") {
        PhysicalMemory odd(0x1800, "odd");
        REQUIRE(odd.page_count() == 2);
        REQUIRE(odd.slice_page(1).size() == 0x800);
    }

    SECTION("Fill and clear") {
        memory.fill(0xFF);
        REQUIRE(memory.data()[0x2FFF] == 0xFF);
        memory.clear();
        REQUIRE(memory.data()[0x2FFF] == 0x00);
    }

    SECTION("Empty pools are rejected") {
        REQUIRE_THROWS_AS(PhysicalMemory(0, "nothing"), std::invalid_argument);
    }
}

TEST_CASE("PhysicalMemory privileged writes", "[physical][privilege]") {
    PhysicalMemory rom(0x1000, "Boot ROM");
    const std::array<uint8_t, 3> image{0x4C, 0x00, 0xF0};

    SECTION("Copies bytes and records the holder") {
        rom.write_physical(DebugPrivilege("bring-up"), 0xFFD, image);
        REQUIRE(rom.data()[0xFFD] == 0x4C);
        REQUIRE(rom.data()[0xFFF] == 0xF0);
        REQUIRE(rom.last_privileged_writer() == "bring-up");
    }

    SECTION("Out of range writes are rejected and change nothing") {
        REQUIRE_THROWS_AS(rom.write_physical(DebugPrivilege("debugger"), 0xFFE, image), std::out_of_range);
        REQUIRE(rom.data()[0xFFE] == 0x00);
        REQUIRE(rom.last_privileged_writer().empty());
    }
}
