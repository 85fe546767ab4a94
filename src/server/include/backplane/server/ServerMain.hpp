// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Backplane.
//
// Backplane is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Backplane is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Backplane.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef BACKPLANE_SERVER_SERVER_MAIN_HPP
#define BACKPLANE_SERVER_SERVER_MAIN_HPP

#include "backplane/Machines.hpp"
#include "backplane/MonitorTraps.hpp"
#include "backplane/service/Conversions.hpp"
#include "backplane/service/Server.hpp"
#include "backplane/server/RomLocator.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace backplane::server {

namespace {

constexpr uint16_t DEFAULT_GRPC_PORT = 0x6502;  // 25858

std::atomic<bool> g_running{true};

void signal_handler(int /*signal*/) {
    g_running = false;
}

struct ServerOptions {
    std::string machine = "apple2plus";
    std::string cpu = "nmos";
    std::optional<std::string> boot_rom;
    uint32_t ram_kb = 0;  // 0 = machine default
    std::map<int, std::string> slot_roms;       // slot -> file
    std::map<int, std::string> expansion_roms;  // slot -> file
    bool language_card = false;
    bool traps = true;
    bool debug_features = true;
    std::optional<std::string> rom_dirpath;
    uint16_t port = DEFAULT_GRPC_PORT;
    bool help = false;
    bool info = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n"
              << "\n"
              << "Optional:\n"
              << "  --machine <type>               apple2plus (default) or generic-6502\n"
              << "  --cpu <type>                   nmos (default), cmos or rockwell\n"
              << "  --boot-rom <filepath>          System ROM (default: apple2plus.rom / boot.rom)\n"
              << "  --ram <KB>                     RAM size in KB (default: machine maximum)\n"
              << "  --slot-rom <slot>:<filepath>   Card with this 256-byte firmware in slot 1-7\n"
              << "  --expansion-rom <slot>:<filepath>\n"
              << "                                 2KB $C800 ROM for the card in that slot\n"
              << "  --language-card                16KB language card in slot 0\n"
              << "  --no-traps                     Run firmware routines natively on the CPU\n"
              << "  --no-debug                     Refuse privileged memory writes\n"
              << "  --rom-dir <dirpath>            ROM directory (auto-detected if not specified)\n"
              << "  --port <port>                  gRPC port (default: " << DEFAULT_GRPC_PORT << ")\n"
              << "  --info                         Show machine information and exit\n"
              << "  --help                         Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --language-card\n"
              << "  " << program_name << " --slot-rom 6:disk2.rom --ram 48\n";
}

// Parse "slot:filepath" format, returns (slot, filepath)
std::pair<int, std::string> parse_slot_arg(const std::string& option, const std::string& arg) {
    const auto colon_pos = arg.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("Invalid " + option + " format: " + arg + " (expected slot:filepath)");
    }
    const std::string slot_str = arg.substr(0, colon_pos);
    const int slot = std::stoi(slot_str);
    if (slot < kFirstSlot || slot > kLastSlot) {
        throw std::runtime_error("Invalid slot number: " + slot_str + " (must be 1-7)");
    }
    return {slot, arg.substr(colon_pos + 1)};
}

ServerOptions parse_arguments(int argc, char* argv[]) {
    ServerOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--info") {
            options.info = true;
        } else if (arg == "--machine" && has_value) {
            options.machine = argv[++i];
        } else if (arg == "--cpu" && has_value) {
            options.cpu = argv[++i];
        } else if (arg == "--boot-rom" && has_value) {
            options.boot_rom = argv[++i];
        } else if (arg == "--ram" && has_value) {
            options.ram_kb = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--slot-rom" && has_value) {
            auto [slot, filepath] = parse_slot_arg(arg, argv[++i]);
            options.slot_roms[slot] = filepath;
        } else if (arg == "--expansion-rom" && has_value) {
            auto [slot, filepath] = parse_slot_arg(arg, argv[++i]);
            options.expansion_roms[slot] = filepath;
        } else if (arg == "--language-card") {
            options.language_card = true;
        } else if (arg == "--no-traps") {
            options.traps = false;
        } else if (arg == "--no-debug") {
            options.debug_features = false;
        } else if (arg == "--rom-dir" && has_value) {
            options.rom_dirpath = argv[++i];
        } else if (arg == "--port" && has_value) {
            options.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return options;
}

MachineConstants machine_constants(const std::string& machine) {
    if (machine == "apple2plus") {
        return MachineConstants::apple_ii_plus();
    }
    if (machine == "generic-6502") {
        return MachineConstants::generic_6502();
    }
    throw std::invalid_argument("Unknown machine type: " + machine);
}

std::vector<uint8_t> load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("Cannot read file: " + filepath.string());
    }

    return data;
}

// The command line as a parts list
ProvisioningBundle make_bundle(const ServerOptions& options, const MachineConstants& constants,
                               const RomLocator& roms) {
    auto builder = ProvisioningBundle::builder();
    builder.with_ram_size(options.ram_kb * 1024)
           .with_debug_features(options.debug_features);

    const std::string boot_name = options.boot_rom.value_or(
        constants.has_io_page() ? "apple2plus.rom" : "boot.rom");
    const auto boot_path = roms.find(boot_name);
    std::cout << "Loading boot ROM: " << boot_path << "\n";
    builder.with_rom_image(ProvisioningBundle::kBootRomImage, load_file(boot_path));

    if (constants.has_io_page()) {
        builder.with_device("keyboard").with_device("speaker");
    }
    if (options.language_card) {
        builder.with_device("language_card");
    }

    for (const auto& [slot, filepath] : options.slot_roms) {
        const std::string image_id = "slot" + std::to_string(slot);
        const auto rom_path = roms.find(filepath);
        std::cout << "Loading slot " << slot << " ROM: " << rom_path << "\n";
        builder.with_rom_image(image_id, load_file(rom_path));

        std::map<std::string, std::string> card_options{{"rom", image_id}};
        if (auto it = options.expansion_roms.find(slot); it != options.expansion_roms.end()) {
            const std::string expansion_id = image_id + "_expansion";
            const auto expansion_path = roms.find(it->second);
            std::cout << "Loading slot " << slot << " expansion ROM: " << expansion_path << "\n";
            builder.with_rom_image(expansion_id, load_file(expansion_path));
            card_options["expansion_rom"] = expansion_id;
        }
        builder.with_device("rom_card", slot, std::move(card_options));
    }
    for (const auto& [slot, filepath] : options.expansion_roms) {
        if (!options.slot_roms.contains(slot)) {
            std::cerr << "Warning: no --slot-rom for slot " << slot << ", expansion ROM ignored\n";
        }
    }

    return builder.build();
}

void print_info(const char* program_name, const MachineConstants& constants) {
    // JSON output for machine discovery
    std::cout << "{\n"
              << "  \"executable\": \"" << program_name << "\",\n"
              << "  \"machine_type\": \"" << constants.type_id << "\",\n"
              << "  \"display_name\": \"" << constants.name << "\",\n"
              << "  \"address_space_bits\": " << constants.address_space_bits << ",\n"
              << "  \"default_ram_size\": " << constants.default_ram_size << ",\n"
              << "  \"slot_count\": " << constants.slot_count << "\n"
              << "}\n";
}

} // anonymous namespace

template<typename MachineType>
int run_server(const ServerOptions& options, const MachineConstants& constants) {
    const RomLocator roms(constants.type_id, options.rom_dirpath);
    const ProvisioningBundle bundle = make_bundle(options, constants, roms);

    std::cout << "Initializing " << constants.name << " (" << MachineType::CpuType::name << ")...\n";
    std::vector<std::string> warnings;
    auto machine = make_machine<typename MachineType::CpuType>(constants, bundle, &warnings);
    for (const auto& warning : warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
    for (const auto& region : machine->memory_regions()) {
        std::cout << "  " << region.id << " at " << service::hex_address(region.base_address)
                  << " (" << region.size << " bytes)\n";
    }

    if (options.traps && constants.has_io_page()) {
        install_monitor_traps(machine->board().traps());
        std::cout << "Installed " << machine->board().traps().count() << " firmware traps\n";
    }

    // Start gRPC server
    service::Server<MachineType> server(*machine, "0.0.0.0", options.port);
    server.start();
    std::cout << "gRPC server listening on port " << server.port() << "\n";

    std::cout << constants.name << " running. Press Ctrl+C to stop.\n";

    // Main emulation loop
    constexpr uint64_t cycles_per_frame = 17030;  // One 60Hz frame at 1.023MHz
    while (g_running) {
        // Block if debugger has paused execution
        machine->wait_if_paused();

        machine->run(cycles_per_frame);
    }

    std::cout << "\nShutting down...\n";
    server.stop();
    return 0;
}

inline int server_main(int argc, char* argv[]) {
    ServerOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        const MachineConstants constants = machine_constants(options.machine);
        if (options.info) {
            print_info(argv[0], constants);
            return 0;
        }

        if (options.cpu == "nmos") {
            return run_server<Nmos6502Machine>(options, constants);
        }
        if (options.cpu == "cmos") {
            return run_server<Cmos65C02Machine>(options, constants);
        }
        if (options.cpu == "rockwell") {
            return run_server<Rockwell65C02Machine>(options, constants);
        }
        throw std::invalid_argument("Unknown CPU type: " + options.cpu);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace backplane::server

#endif // BACKPLANE_SERVER_SERVER_MAIN_HPP
