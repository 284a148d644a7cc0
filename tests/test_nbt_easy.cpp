
#include "nbt/nbt_easy.hpp"

#include "nbt_test_util.hpp"

#include <cstdint>
#include <iostream>
#include <vector>

using nbt::ErrorKind;
using nbt::TagType;
using nbt_test::Bytes;

static std::vector<std::uint8_t> make_level() {
    Bytes b;
    b.root();
    b.named(TagType::Compound, "Data");
    b.named(TagType::String, "LevelName").str("world");
    b.named(TagType::Byte, "hardcore").u8(1);
    b.named(TagType::Long, "Time").i64(24000);
    b.named(TagType::Float, "rainTime").f32(0.5f);
    b.named(TagType::Double, "BorderSize").f64(6.0e7);
    b.named(TagType::Short, "Difficulty").i16(2);
    b.named(TagType::Compound, "Player");
    b.named(TagType::Int, "XpLevel").i32(12);
    b.named(TagType::List, "Inventory").u8(static_cast<std::uint8_t>(TagType::Compound)).i32(2);
    b.named(TagType::String, "id").str("minecraft:torch").named(TagType::Byte, "Slot").u8(0).end();
    b.named(TagType::String, "id").str("minecraft:bread").named(TagType::Byte, "Slot").u8(8).end();
    b.end();  // Player
    b.end();  // Data
    b.end();  // root
    return b.b;
}

static void test_find_paths() {
    std::vector<std::uint8_t> buf = make_level();
    nbt::NamedTag r = nbt::parse(buf);
    const nbt::Compound& root = r.tag.as_compound();

    const nbt::Tag* name = nbt::easy::find(root, "Data.LevelName");
    CHECK(name != nullptr);
    CHECK(name->as_string() == "world");

    const nbt::Tag* bread = nbt::easy::find(root, "Data.Player.Inventory.1.id");
    CHECK(bread != nullptr);
    CHECK(bread->as_string() == "minecraft:bread");

    CHECK(nbt::easy::find(root, "Data.Player.Inventory.2.id") == nullptr);
    CHECK(nbt::easy::find(root, "Data.Player.Inventory.x") == nullptr);
    CHECK(nbt::easy::find(root, "Data.LevelName.deeper") == nullptr);
    CHECK(nbt::easy::find(root, "Nope") == nullptr);

    CHECK_THROWS_KIND(nbt::easy::find(root, ""), ErrorKind::MalformedData);
    CHECK_THROWS_KIND(nbt::easy::find(root, "Data..LevelName"), ErrorKind::MalformedData);
    CHECK_THROWS_KIND(nbt::easy::find(root, "Data."), ErrorKind::MalformedData);
}

static void test_typed_getters() {
    std::vector<std::uint8_t> buf = make_level();
    nbt::NamedTag r = nbt::parse(buf);
    const nbt::Compound& root = r.tag.as_compound();

    CHECK(nbt::easy::get_string(root, "Data.LevelName") == std::optional<std::string_view>("world"));
    CHECK(nbt::easy::get_bool(root, "Data.hardcore") == std::optional<bool>(true));
    CHECK(nbt::easy::get_long(root, "Data.Time") == std::optional<std::int64_t>(24000));
    CHECK(nbt::easy::get_float(root, "Data.rainTime") == std::optional<float>(0.5f));
    CHECK(nbt::easy::get_double(root, "Data.BorderSize") == std::optional<double>(6.0e7));
    CHECK(nbt::easy::get_short(root, "Data.Difficulty") == std::optional<std::int16_t>(2));
    CHECK(nbt::easy::get_int(root, "Data.Player.XpLevel") == std::optional<std::int32_t>(12));
    CHECK(nbt::easy::get_byte(root, "Data.Player.Inventory.1.Slot") == std::optional<std::int8_t>(8));

    // Wrong type or missing: nullopt, never a throw.
    CHECK(!nbt::easy::get_int(root, "Data.Time").has_value());
    CHECK(!nbt::easy::get_string(root, "Data.Missing").has_value());

    const nbt::List* inv = nbt::easy::get_list(root, "Data.Player.Inventory");
    CHECK(inv != nullptr);
    CHECK(inv->size() == 2);
    CHECK(nbt::easy::get_list(root, "Data.Player") == nullptr);

    const nbt::Compound* player = nbt::easy::get_compound(root, "Data.Player");
    CHECK(player != nullptr);
    CHECK(player->contains("XpLevel"));
    CHECK(nbt::easy::get_compound(root, "Data.LevelName") == nullptr);
}

int main() {
    try {
        test_find_paths();
        test_typed_getters();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
