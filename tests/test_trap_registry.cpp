#include <catch2/catch_test_macros.hpp>
#include <backplane/EventContext.hpp>
#include <backplane/IoPageDispatcher.hpp>
#include <backplane/MemoryBus.hpp>
#include <backplane/Scheduler.hpp>
#include <backplane/SignalBus.hpp>
#include <backplane/SlotManager.hpp>
#include <backplane/TrapRegistry.hpp>

#include "TestSupport.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace backplane;
using namespace backplane::test;

namespace {

struct RegistryFixture {
    MemoryBus bus;
    Scheduler scheduler;
    SignalBus signals;
    EventContext context{scheduler, signals, bus};
    FakeCpu cpu;
    TrapRegistry registry;
    int calls = 0;

    TrapHandler counting(Cycle cycles = 5) {
        return [this, cycles](Cpu&, MemoryBus&, EventContext&) {
            ++calls;
            return TrapResult::success(cycles);
        };
    }

    TrapResult run(Addr address, TrapOperation operation) {
        return registry.try_execute(address, operation, cpu, bus, context);
    }
};

} // namespace

TEST_CASE("TrapRegistry registration", "[trap]") {
    RegistryFixture f;

    SECTION("A registered trap is found and runs") {
        f.registry.register_trap(0xFCA8, TrapOperation::Call, "WAIT", TrapCategory::MonitorRom,
                                 f.counting(), "delay loop");
        REQUIRE(f.registry.has_trap(0xFCA8, TrapOperation::Call));
        REQUIRE_FALSE(f.registry.has_trap(0xFCA8, TrapOperation::Read));
        REQUIRE(f.registry.count() == 1);

        const TrapResult result = f.run(0xFCA8, TrapOperation::Call);
        REQUIRE(result.handled);
        REQUIRE(result.cycles == 5);
        REQUIRE(f.calls == 1);
    }

    SECTION("Operations at one address are independent") {
        f.registry.register_trap(0x1000, TrapOperation::Read, "r", TrapCategory::UserDefined, f.counting());
        f.registry.register_trap(0x1000, TrapOperation::Write, "w", TrapCategory::UserDefined, f.counting());
        REQUIRE(f.registry.count() == 2);
        REQUIRE_FALSE(f.run(0x1000, TrapOperation::Call).handled);
        REQUIRE(f.run(0x1000, TrapOperation::Write).handled);
    }

    SECTION("Duplicates are rejected") {
        f.registry.register_trap(0x1000, TrapOperation::Read, "first", TrapCategory::UserDefined, f.counting());
        REQUIRE_THROWS_AS(
            f.registry.register_trap(0x1000, TrapOperation::Read, "second", TrapCategory::UserDefined, f.counting()),
            std::invalid_argument);
    }

    SECTION("Empty handlers and out of range addresses are rejected") {
        REQUIRE_THROWS_AS(
            f.registry.register_trap(0x1000, TrapOperation::Read, "empty", TrapCategory::UserDefined, nullptr),
            std::invalid_argument);
        REQUIRE_THROWS_AS(
            f.registry.register_trap(0x10000, TrapOperation::Read, "far", TrapCategory::UserDefined, f.counting()),
            std::invalid_argument);
    }

    SECTION("Nothing registered means not handled") {
        REQUIRE_FALSE(f.run(0x4000, TrapOperation::Read).handled);
        REQUIRE_FALSE(f.run(0xFFFF, TrapOperation::Call).handled);
    }

    SECTION("Unregister removes exactly one trap") {
        f.registry.register_trap(0x1000, TrapOperation::Read, "r", TrapCategory::UserDefined, f.counting());
        REQUIRE(f.registry.unregister_trap(0x1000, TrapOperation::Read));
        REQUIRE_FALSE(f.registry.unregister_trap(0x1000, TrapOperation::Read));
        REQUIRE(f.registry.count() == 0);
        REQUIRE_FALSE(f.run(0x1000, TrapOperation::Read).handled);
    }

    SECTION("Clear removes everything") {
        f.registry.register_trap(0x1000, TrapOperation::Read, "r", TrapCategory::UserDefined, f.counting());
        f.registry.register_trap(0x2000, TrapOperation::Call, "c", TrapCategory::UserDefined, f.counting());
        f.registry.clear();
        REQUIRE(f.registry.count() == 0);
        REQUIRE(f.registry.traps().empty());
        REQUIRE_FALSE(f.registry.has_trap(0x2000, TrapOperation::Call));
    }
}

TEST_CASE("TrapRegistry enabling", "[trap][enable]") {
    RegistryFixture f;
    f.registry.register_trap(0xFCA8, TrapOperation::Call, "WAIT", TrapCategory::MonitorRom, f.counting());
    f.registry.register_trap(0xFDED, TrapOperation::Call, "COUT", TrapCategory::MonitorRom, f.counting());
    f.registry.register_trap(0xD000, TrapOperation::Call, "BASIC", TrapCategory::ApplesoftBasic, f.counting());

    SECTION("A disabled trap does not run") {
        REQUIRE(f.registry.set_enabled(0xFCA8, TrapOperation::Call, false));
        REQUIRE_FALSE(f.run(0xFCA8, TrapOperation::Call).handled);
        REQUIRE(f.calls == 0);
        REQUIRE_FALSE(f.registry.trap_info(0xFCA8, TrapOperation::Call)->enabled);
    }

    SECTION("Enabling an unknown trap reports failure") {
        REQUIRE_FALSE(f.registry.set_enabled(0x1234, TrapOperation::Call, false));
    }

    SECTION("Category switches affect only that category") {
        REQUIRE(f.registry.set_category_enabled(TrapCategory::MonitorRom, false) == 2);
        REQUIRE_FALSE(f.run(0xFCA8, TrapOperation::Call).handled);
        REQUIRE_FALSE(f.run(0xFDED, TrapOperation::Call).handled);
        REQUIRE(f.run(0xD000, TrapOperation::Call).handled);
    }

    SECTION("Later registrations inherit the category setting") {
        f.registry.set_category_enabled(TrapCategory::Dos33, false);
        f.registry.register_trap(0x3D0, TrapOperation::Call, "DOS", TrapCategory::Dos33, f.counting());
        REQUIRE_FALSE(f.registry.is_category_enabled(TrapCategory::Dos33));
        REQUIRE_FALSE(f.registry.trap_info(0x3D0, TrapOperation::Call)->enabled);
        REQUIRE_FALSE(f.run(0x3D0, TrapOperation::Call).handled);
    }
}

TEST_CASE("TrapRegistry introspection", "[trap][info]") {
    RegistryFixture f;
    f.registry.register_trap(0xFDED, TrapOperation::Call, "COUT", TrapCategory::MonitorRom, f.counting(), "output");
    f.registry.register_trap(0x0300, TrapOperation::Write, "w", TrapCategory::UserDefined, f.counting());
    f.registry.register_trap(0x0300, TrapOperation::Read, "r", TrapCategory::UserDefined, f.counting());

    SECTION("traps() is ordered by address then operation") {
        const auto traps = f.registry.traps();
        REQUIRE(traps.size() == 3);
        REQUIRE(traps[0].name == "r");
        REQUIRE(traps[1].name == "w");
        REQUIRE(traps[2].name == "COUT");
        REQUIRE(traps[2].description == "output");
        REQUIRE(traps[2].category == TrapCategory::MonitorRom);
    }

    SECTION("Hits are counted for handled executions only") {
        f.run(0xFDED, TrapOperation::Call);
        f.run(0xFDED, TrapOperation::Call);
        REQUIRE(f.registry.trap_info(0xFDED, TrapOperation::Call)->hits == 2);
    }

    SECTION("Unknown traps have no info") {
        REQUIRE_FALSE(f.registry.trap_info(0x1234, TrapOperation::Read).has_value());
    }

    SECTION("Range queries") {
        REQUIRE(f.registry.has_any_in_range(0x02FF, 2, TrapOperation::Read));
        REQUIRE_FALSE(f.registry.has_any_in_range(0x0301, 8, TrapOperation::Read));
    }

    SECTION("Names for the wire") {
        REQUIRE(to_string(TrapOperation::Call) == "Call");
        REQUIRE(to_string(TrapCategory::SlotFirmware) == "SlotFirmware");
    }
}

TEST_CASE("TrapRegistry handlers may remove traps while running", "[trap][oneshot]") {
    RegistryFixture f;
    std::string seen;

    SECTION("A one-shot trap unregisters itself") {
        const std::string label = "captured by the handler";
        f.registry.register_trap(0x0300, TrapOperation::Call, "once", TrapCategory::UserDefined,
            [&f, &seen, label](Cpu&, MemoryBus&, EventContext&) {
                f.registry.unregister_trap(0x0300, TrapOperation::Call);
                seen = label;
                return TrapResult::success(3);
            });

        const TrapResult first = f.run(0x0300, TrapOperation::Call);
        REQUIRE(first.handled);
        REQUIRE(first.cycles == 3);
        REQUIRE(seen == "captured by the handler");
        REQUIRE_FALSE(f.registry.has_trap(0x0300, TrapOperation::Call));
        REQUIRE(f.registry.count() == 0);
        REQUIRE_FALSE(f.run(0x0300, TrapOperation::Call).handled);
    }

    SECTION("A handler clears the registry") {
        f.registry.register_trap(0x0300, TrapOperation::Read, "other", TrapCategory::UserDefined, f.counting());
        f.registry.register_trap(0x0400, TrapOperation::Read, "reset-all", TrapCategory::UserDefined,
            [&f, &seen](Cpu&, MemoryBus&, EventContext&) {
                f.registry.clear();
                seen = "cleared";
                return TrapResult::read_value(0x42);
            });

        const TrapResult result = f.run(0x0400, TrapOperation::Read);
        REQUIRE(result.handled);
        REQUIRE(result.value == 0x42);
        REQUIRE(seen == "cleared");
        REQUIRE(f.registry.count() == 0);
    }

    SECTION("Hits still count for a trap that stays registered") {
        f.registry.register_trap(0x0300, TrapOperation::Call, "sibling-remover", TrapCategory::UserDefined,
            [&f](Cpu&, MemoryBus&, EventContext&) {
                f.registry.unregister_trap(0x0300, TrapOperation::Read);
                return TrapResult::success(1);
            });
        f.registry.register_trap(0x0300, TrapOperation::Read, "sibling", TrapCategory::UserDefined, f.counting());

        f.run(0x0300, TrapOperation::Call);
        REQUIRE(f.registry.trap_info(0x0300, TrapOperation::Call)->hits == 1);
        REQUIRE_FALSE(f.registry.has_trap(0x0300, TrapOperation::Read));
    }
}

TEST_CASE("TrapRegistry slot traps follow the selected expansion ROM", "[trap][slot]") {
    RegistryFixture f;
    IoPageDispatcher io;
    SlotManager slots(io);
    std::vector<std::string> journal;
    JournalCard card("disk", journal);
    slots.install(6, card);
    f.registry.set_slot_manager(&slots);

    f.registry.register_slot_trap(0xC85C, 6, TrapOperation::Call, "RWTS", TrapCategory::SlotFirmware, f.counting());

    SECTION("Not handled while the slot is not selected") {
        REQUIRE_FALSE(f.run(0xC85C, TrapOperation::Call).handled);
    }

    SECTION("Handled once the slot's expansion ROM is selected") {
        slots.select_expansion_slot(6);
        REQUIRE(f.run(0xC85C, TrapOperation::Call).handled);
    }

    SECTION("Checked at execution time") {
        slots.select_expansion_slot(6);
        slots.select_expansion_slot(5);
        REQUIRE_FALSE(f.run(0xC85C, TrapOperation::Call).handled);
    }

    SECTION("Slot numbers are validated") {
        REQUIRE_THROWS_AS(
            f.registry.register_slot_trap(0xC800, 8, TrapOperation::Call, "bad", TrapCategory::SlotFirmware, f.counting()),
            std::invalid_argument);
    }
}
