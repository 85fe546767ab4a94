#pragma once

#include <backplane/BusTarget.hpp>
#include <backplane/Cpu.hpp>
#include <backplane/Peripheral.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace backplane::test {

// Plain register file standing in for a CPU binding
class FakeCpu final : public Cpu {
public:
    uint8_t a() const override { return a_; }
    uint8_t x() const override { return x_; }
    uint8_t y() const override { return y_; }
    uint8_t sp() const override { return sp_; }
    uint8_t p() const override { return p_; }
    uint16_t pc() const override { return pc_; }

    void set_a(uint8_t value) override { a_ = value; }
    void set_x(uint8_t value) override { x_ = value; }
    void set_y(uint8_t value) override { y_ = value; }
    void set_sp(uint8_t value) override { sp_ = value; }
    void set_p(uint8_t value) override { p_ = value; }
    void set_pc(uint16_t value) override { pc_ = value; }

    uint8_t a_ = 0;
    uint8_t x_ = 0;
    uint8_t y_ = 0;
    uint8_t sp_ = 0xFF;
    uint8_t p_ = 0x24;
    uint16_t pc_ = 0;
};

struct RecordedAccess {
    Addr physical;
    bool write;
    uint8_t value;
    uint8_t width;
    AccessIntent intent;
    Cycle cycle;
};

// Byte store that records every call made on it
class RecordingTarget final : public BusTarget {
public:
    explicit RecordingTarget(uint32_t size = kPageSize,
                             TargetCaps caps = TargetCaps::SupportsPeek | TargetCaps::SupportsPoke)
        : bytes(size, 0), caps_(caps) {}

    TargetCaps caps() const override { return caps_; }

    uint8_t read8(Addr physical, const BusAccess& access) override {
        accesses.push_back({physical, false, bytes[physical % bytes.size()], 8, access.intent, access.cycle});
        return bytes[physical % bytes.size()];
    }

    void write8(Addr physical, uint8_t value, const BusAccess& access) override {
        accesses.push_back({physical, true, value, 8, access.intent, access.cycle});
        bytes[physical % bytes.size()] = value;
    }

    uint16_t read16(Addr physical, const BusAccess& access) override {
        ++wide_calls;
        return BusTarget::read16(physical, access);
    }

    void write16(Addr physical, uint16_t value, const BusAccess& access) override {
        ++wide_calls;
        BusTarget::write16(physical, value, access);
    }

    std::vector<uint8_t> bytes;
    std::vector<RecordedAccess> accesses;
    int wide_calls = 0;

private:
    TargetCaps caps_;
};

// Slot card that logs selection notifications into a shared journal
class JournalCard final : public SlotCard {
public:
    JournalCard(std::string name, std::vector<std::string>& journal)
        : name_(std::move(name)), journal_(journal) {}

    std::string_view name() const override { return name_; }
    std::string_view device_type() const override { return "journal_card"; }

    void initialize(EventContext&) override { ++initialize_count; }
    void reset() override { ++reset_count; }

    void on_expansion_rom_selected() override { journal_.push_back(name_ + " selected"); }
    void on_expansion_rom_deselected() override { journal_.push_back(name_ + " deselected"); }

    int initialize_count = 0;
    int reset_count = 0;

private:
    std::string name_;
    std::vector<std::string>& journal_;
};

inline PageEntry entry_for(BusTarget& target, PagePerms perms = PagePerms::All,
                           RegionTag tag = RegionTag::Ram, uint32_t device_id = 1,
                           Addr physical_base = 0) {
    PageEntry entry;
    entry.device_id = device_id;
    entry.tag = tag;
    entry.perms = perms;
    entry.caps = target.caps();
    entry.target = &target;
    entry.physical_base = physical_base;
    return entry;
}

} // namespace backplane::test
