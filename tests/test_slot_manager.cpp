#include <catch2/catch_test_macros.hpp>
#include <backplane/IoPageDispatcher.hpp>
#include <backplane/SlotManager.hpp>

#include "TestSupport.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace backplane;
using namespace backplane::test;

TEST_CASE("SlotManager installation", "[slot]") {
    IoPageDispatcher io;
    SlotManager slots(io);
    std::vector<std::string> journal;
    JournalCard card("card", journal);

    SECTION("Installed cards learn their slot") {
        slots.install(4, card);
        REQUIRE(slots.card(4) == &card);
        REQUIRE(card.slot() == 4);
        REQUIRE(slots.occupied_slots() == std::vector<int>{4});
    }

    SECTION("Occupied and out of range slots are rejected") {
        JournalCard other("other", journal);
        slots.install(4, card);
        REQUIRE_THROWS_AS(slots.install(4, other), std::logic_error);
        REQUIRE_THROWS_AS(slots.install(0, other), std::out_of_range);
        REQUIRE_THROWS_AS(slots.install(8, other), std::out_of_range);
    }

    SECTION("Removing an empty slot reports false") {
        REQUIRE_FALSE(slots.remove(2));
    }

    SECTION("A card without firmware has no ROM targets") {
        slots.install(4, card);
        REQUIRE(slots.slot_rom(4) == nullptr);
        REQUIRE(slots.expansion_rom(4) == nullptr);
        REQUIRE(slots.slot_rom(5) == nullptr);
    }
}

TEST_CASE("SlotManager expansion ROM selection", "[slot][expansion]") {
    IoPageDispatcher io;
    SlotManager slots(io);
    std::vector<std::string> journal;
    JournalCard three("slot3", journal);
    JournalCard five("slot5", journal);
    slots.install(3, three);
    slots.install(5, five);

    SECTION("Deselection of the previous card is notified before the new selection") {
        slots.select_expansion_slot(5);
        slots.select_expansion_slot(3);
        REQUIRE(journal == std::vector<std::string>{"slot5 selected", "slot5 deselected", "slot3 selected"});
        REQUIRE(slots.active_expansion_slot() == 3);
    }

    SECTION("Reselecting the active slot does nothing") {
        slots.select_expansion_slot(5);
        slots.select_expansion_slot(5);
        REQUIRE(journal == std::vector<std::string>{"slot5 selected"});
    }

    SECTION("Accesses to $Cnxx select slot n") {
        slots.handle_slot_rom_access(0xC300);
        REQUIRE(slots.active_expansion_slot() == 3);
        slots.handle_slot_rom_access(0xC5FF);
        REQUIRE(slots.active_expansion_slot() == 5);
    }

    SECTION("$C0xx and $C8xx do not select anything") {
        slots.handle_slot_rom_access(0xC080);
        slots.handle_slot_rom_access(0xC800);
        REQUIRE_FALSE(slots.active_expansion_slot().has_value());
    }

    SECTION("Removing the active card deselects it") {
        slots.select_expansion_slot(3);
        REQUIRE(slots.remove(3));
        REQUIRE_FALSE(slots.active_expansion_slot().has_value());
        REQUIRE(journal.back() == "slot3 deselected");
    }

    SECTION("Reset deselects and resets every card") {
        slots.select_expansion_slot(5);
        slots.reset();
        REQUIRE_FALSE(slots.active_expansion_slot().has_value());
        REQUIRE(journal.back() == "slot5 deselected");
        REQUIRE(three.reset_count == 1);
        REQUIRE(five.reset_count == 1);
    }

    SECTION("An empty slot can be selected") {
        slots.select_expansion_slot(7);
        REQUIRE(slots.active_expansion_slot() == 7);
        REQUIRE(slots.active_expansion_rom() == nullptr);
    }
}

TEST_CASE("IoPageDispatcher soft switches", "[slot][io]") {
    IoPageDispatcher io;
    const BusAccess read = BusAccess::data_read(0xC030);

    SECTION("Unclaimed locations float and ignore writes") {
        REQUIRE(io.read(0x30, read) == kFloatingBus);
        REQUIRE_NOTHROW(io.write(0x30, 0x00, read));
    }

    SECTION("Handlers receive the offset") {
        uint8_t seen = 0;
        io.register_read(0x30, [&](uint8_t offset, const BusAccess&) { seen = offset; return uint8_t{0x12}; });
        REQUIRE(io.read(0x30, read) == 0x12);
        REQUIRE(seen == 0x30);
    }

    SECTION("Double registration is rejected") {
        io.register_read(0x30, [](uint8_t, const BusAccess&) { return uint8_t{0}; });
        REQUIRE_THROWS_AS(io.register_read(0x30, [](uint8_t, const BusAccess&) { return uint8_t{0}; }),
                          std::invalid_argument);
        REQUIRE_NOTHROW(io.register_write(0x30, [](uint8_t, uint8_t, const BusAccess&) {}));
        REQUIRE_THROWS_AS(io.register_switch(0x30, nullptr, [](uint8_t, uint8_t, const BusAccess&) {}),
                          std::invalid_argument);
    }

    SECTION("Slot handlers land at $C080 + slot * 16") {
        SlotIoHandlers handlers;
        handlers.set(0x0C, [](uint8_t offset, const BusAccess&) { return offset; }, nullptr);
        io.install_slot_handlers(6, handlers);
        REQUIRE(io.has_read_handler(0xEC));
        REQUIRE(io.read(0xEC, read) == 0xEC);

        io.remove_slot_handlers(6);
        REQUIRE_FALSE(io.has_read_handler(0xEC));
    }

    SECTION("Slot handlers that collide are rejected") {
        io.register_read(0x80, [](uint8_t, const BusAccess&) { return uint8_t{0}; });
        SlotIoHandlers handlers;
        handlers.set(0x00, [](uint8_t, const BusAccess&) { return uint8_t{0}; }, nullptr);
        REQUIRE_THROWS_AS(io.install_slot_handlers(0, handlers), std::invalid_argument);
        REQUIRE_THROWS_AS(io.install_slot_handlers(8, handlers), std::out_of_range);
    }
}
