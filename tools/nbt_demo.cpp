#include "nbt/nbt_easy.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>


// Minimal big-endian emitter for the built-in sample.
struct Emit {
    std::vector<std::uint8_t> b;

    Emit& u8(std::uint8_t v) { b.push_back(v); return *this; }
    Emit& u16(std::uint16_t v) { u8((std::uint8_t)(v >> 8)); return u8((std::uint8_t)v); }
    Emit& u32(std::uint32_t v) { u16((std::uint16_t)(v >> 16)); return u16((std::uint16_t)v); }
    Emit& u64(std::uint64_t v) { u32((std::uint32_t)(v >> 32)); return u32((std::uint32_t)v); }
    Emit& str(const std::string& s) {
        u16((std::uint16_t)s.size());
        b.insert(b.end(), s.begin(), s.end());
        return *this;
    }
    Emit& named(nbt::TagType t, const std::string& name) { u8((std::uint8_t)t); return str(name); }
};

// level.dat-like layout:
//   "" { Data { LevelName, SpawnX/Y/Z, Time, Player { Pos: List<Double>, Inventory: List<Compound> } } }
static std::vector<std::uint8_t> make_sample() {
    using nbt::TagType;
    Emit e;
    e.named(TagType::Compound, "");
    e.named(TagType::Compound, "Data");
    e.named(TagType::String, "LevelName").str("Demo World");
    e.named(TagType::Int, "SpawnX").u32(128);
    e.named(TagType::Int, "SpawnY").u32(64);
    e.named(TagType::Int, "SpawnZ").u32((std::uint32_t)-256);
    e.named(TagType::Long, "Time").u64(123456789);
    e.named(TagType::Compound, "Player");
    e.named(TagType::List, "Pos").u8((std::uint8_t)TagType::Double).u32(3);
    for (double d : {128.5, 64.0, -255.5}) {
        std::uint64_t bits;
        std::memcpy(&bits, &d, sizeof(bits));
        e.u64(bits);
    }
    e.named(TagType::List, "Inventory").u8((std::uint8_t)TagType::Compound).u32(2);
    e.named(TagType::String, "id").str("minecraft:diamond_pickaxe").named(TagType::Byte, "Count").u8(1).u8(0);
    e.named(TagType::String, "id").str("minecraft:cobblestone").named(TagType::Byte, "Count").u8(64).u8(0);
    e.u8(0); // Player
    e.u8(0); // Data
    e.u8(0); // root
    return e.b;
}

int main(int argc, char** argv) {
    try {
        using namespace nbt;

        Document doc = (argc >= 2)
            ? Document::read_file(argv[1])
            : Document::from_bytes(make_sample());

        std::cout << "Root: \"" << doc.name() << "\" entries=" << doc.compound().size()
                  << " compressed=" << (doc.was_compressed() ? "yes" : "no") << "\n";

        const Compound& root = doc.compound();

        if (auto name = easy::get_string(root, "Data.LevelName")) {
            std::cout << "LevelName: " << *name << "\n";
        }
        auto x = easy::get_int(root, "Data.SpawnX");
        auto y = easy::get_int(root, "Data.SpawnY");
        auto z = easy::get_int(root, "Data.SpawnZ");
        if (x && y && z) {
            std::cout << "Spawn: " << *x << ", " << *y << ", " << *z << "\n";
        }
        if (auto t = easy::get_long(root, "Data.Time")) {
            std::cout << "Time: " << *t << "\n";
        }

        if (const List* pos = easy::get_list(root, "Data.Player.Pos")) {
            std::cout << "Player.Pos:";
            for (const Tag& p : *pos) {
                if (p.is(TagType::Double)) std::cout << " " << p.as_double();
            }
            std::cout << "\n";
        }

        if (const List* inv = easy::get_list(root, "Data.Player.Inventory")) {
            std::cout << "Inventory (" << inv->size() << " stacks):\n";
            for (std::size_t i = 0; i < inv->size(); ++i) {
                std::string base = "Data.Player.Inventory." + std::to_string(i);
                auto id = easy::get_string(root, base + ".id");
                auto count = easy::get_byte(root, base + ".Count");
                std::cout << "  " << (id ? *id : std::string_view("?"))
                          << " x" << (count ? (int)*count : 0) << "\n";
            }
        }

        std::cout << "OK\n";
        return 0;

    } catch (const nbt::NbtError& e) {
        std::cerr << "NBT error [" << nbt::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
