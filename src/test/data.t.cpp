#if !defined(SK_NO_TESTS)
#include "catch.hpp"
#include "data.hpp"
#include "combat.hpp"
#include "definition.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "inventory.hpp"
#include "message_log.hpp"
#include "ownership.hpp"
#include "random.hpp"
#include "world.hpp"

#include <string>

namespace {

using namespace skirmish;

std::string const equipment_json = R"({
  "type": "equipment",
  "data": {
    "sword":  {"name": "sword",  "properties": {"category": "weapon", "weight": 30, "value": 400, "damage": 28}},
    "armor":  {"name": "armor",  "properties": {"category": "armor",  "weight": 60, "value": 900, "armor_type": "bronze", "protection": 45}},
    "purse":  {"name": "purse",  "properties": {"category": "purse",  "weight": 5,  "capacity": 20, "contents": 2}},
    "pouch":  {"name": "pouch",  "properties": {"category": "purse",  "weight": 2,  "capacity": 10, "contents": 3, "shiny": false}},
    "pack":   {"name": "pack",   "properties": {"category": "backpack", "weight": 20, "value": 50, "capacity": 100}}
  }
})";

std::string entities_json(std::string const& extra = {}) {
    return R"({
  "type": "entities",
  "data": {
    "hero": {"name": "Aragorn", "properties": {
        "category": "hero", "max_hit_points": 97, "strength": 14.5,
        "equip_n": 4, "equip_0": "sword", "equip_1": "armor", "equip_2": "purse", "equip_3": "pack"}},
    "monster": {"name": "Grendel's Mother", "properties": {
        "category": "monster", "max_hit_points": 89, "damage": 35, "skin": "scaly",
        "anchors": 3, "spare_capacity": 40,
        "equip_n": 2, "equip_0": "sword", "equip_1": "pouch"}})"
      + extra + R"(
  }
})";
}

entity_id id_of(char const* const s) noexcept {
    return entity_id {djb2_hash_32(s)};
}

} // namespace

TEST_CASE("data game database") {
    using namespace skirmish;

    auto const db = make_game_database(equipment_json, entities_json());

    REQUIRE(db->equipment_definition_count() == 5u);
    REQUIRE(db->entity_definition_count() == 2u);

    REQUIRE(db->find(equipment_id {djb2_hash_32c("sword")}) != nullptr);
    REQUIRE(db->find(equipment_id {djb2_hash_32c("dagger")}) == nullptr);
    REQUIRE(db->find(equipment_property_id {djb2_hash_32c("armor_type")}) == string_view {"armor_type"});
    REQUIRE(db->find(entity_property_id {djb2_hash_32c("skin")}) == string_view {"skin"});

    SECTION("definitions translate") {
        auto const& armor = *db->find(equipment_id {djb2_hash_32c("armor")});
        auto const data = to_equipment_data(armor);
        REQUIRE(data.category == equipment_category::armor);
        REQUIRE(data.armor == armor_type::bronze);
        REQUIRE(data.protection == 45);
        REQUIRE(data.shiny);

        auto const& hero = *db->find(id_of("hero"));
        REQUIRE(category_of(hero) == entity_category::hero);
        auto const params = to_hero_params(hero);
        REQUIRE(params.name == "Aragorn");
        REQUIRE(params.strength == Approx(14.5));
        REQUIRE(params.protection == hero_base_protection);
        REQUIRE(loadout_of(hero).size() == 4u);
        REQUIRE_THROWS_AS(to_monster_params(hero), data_error);

        auto const& monster = *db->find(id_of("monster"));
        auto const mparams = to_monster_params(monster);
        REQUIRE(mparams.skin == skin_type::scaly);
        REQUIRE(mparams.anchors == 3);
        REQUIRE(mparams.spare_capacity == 40);
        REQUIRE(mparams.protection < 0);
    }

    SECTION("creating a hero") {
        auto const rng = make_random_state(11);
        auto const w = make_world();

        auto const h = create_entity(*w, *rng, *db, id_of("hero"));
        auto const& e = w->find(h);

        REQUIRE(e.is_a(entity_category::hero));
        REQUIRE(e.hit_points() == 97);
        REQUIRE(e.capacity() == 290);
        REQUIRE(e.left_hand() != nullptr);
        REQUIRE(e.armor() != nullptr);
        REQUIRE(e.free_anchor_count() == 1u);
        REQUIRE(total_weight(*w, e) == 30 + 60 + 105 + 20);
        REQUIRE(is_consistent(*w, e));
    }

    SECTION("creating a monster") {
        auto const rng = make_random_state(12);
        auto const w = make_world();

        auto const m = create_entity(*w, *rng, *db, id_of("monster"));
        auto const& e = w->find(m);

        REQUIRE(e.is_a(entity_category::monster));
        REQUIRE(e.anchor_count() == 3u);
        REQUIRE(e.free_anchor_count() == 1u);
        REQUIRE(e.capacity() == 30 + 152 + 40);
        REQUIRE(effective_protection(*w, e) == 30);
        REQUIRE(!w->find(e.anchor(1).item).is_shiny());
    }

    SECTION("the two fight") {
        auto const rng = make_random_state(13);
        auto const w = make_world();
        auto const log = make_message_log();

        auto const h = create_entity(*w, *rng, *db, id_of("hero"));
        auto const m = create_entity(*w, *rng, *db, id_of("monster"));

        battle b {*w, h, m};
        auto const winner = b.fight(*rng, *log);
        REQUIRE((winner == h || winner == m));
        REQUIRE(w->find(winner).is_alive());
    }

    SECTION("unknown definitions") {
        auto const rng = make_random_state(14);
        auto const w = make_world();

        REQUIRE_THROWS_AS(create_entity(*w, *rng, *db, id_of("dragon")), data_error);
        REQUIRE_THROWS_AS(
            create_equipment(*w, *rng, *db, equipment_id {djb2_hash_32c("dagger")})
          , data_error);
        REQUIRE(w->entity_count() == 0u);
        REQUIRE(w->equipment_count() == 0u);
    }
}

TEST_CASE("data game database errors") {
    using namespace skirmish;

    SECTION("an undefined loadout item") {
        REQUIRE_THROWS_AS(make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "Cave Troll", "properties": {
                "category": "monster", "max_hit_points": 131, "damage": 28,
                "equip_n": 1, "equip_0": "club"}})"))
          , data_error);
    }

    SECTION("a missing loadout slot") {
        REQUIRE_THROWS_AS(make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "Cave Troll", "properties": {
                "category": "monster", "max_hit_points": 131, "damage": 28,
                "equip_n": 2, "equip_0": "sword"}})"))
          , data_error);
    }

    SECTION("too large a loadout") {
        REQUIRE_THROWS_AS(make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "Cave Troll", "properties": {
                "category": "monster", "max_hit_points": 131, "damage": 28,
                "equip_n": 11}})"))
          , data_error);
    }

    SECTION("a property of the wrong type") {
        REQUIRE_THROWS_AS(make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "Cave Troll", "properties": {
                "category": "monster", "max_hit_points": "many"}})"))
          , data_error);
    }

    SECTION("an unknown category") {
        REQUIRE_THROWS_AS(make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "Cave Troll", "properties": {"category": "dragon"}})"))
          , data_error);
    }

    SECTION("an id defined twice") {
        REQUIRE_THROWS_WITH(make_game_database(equipment_json, entities_json(R"(,
            "hero": {"name": "Boromir", "properties": {"category": "hero"}})"))
          , Catch::Matchers::Contains("defined more than once"));
    }

    SECTION("unknown properties are kept") {
        auto const db = make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "Cave Troll", "properties": {
                "category": "monster", "max_hit_points": 131, "damage": 28,
                "smell": "awful"}})"));
        REQUIRE(db->find(entity_property_id {djb2_hash_32c("smell")}) == string_view {"smell"});
    }

    SECTION("a definition that can't be built") {
        auto const db = make_game_database(equipment_json, entities_json(R"(,
            "troll": {"name": "cave troll", "properties": {
                "category": "monster", "max_hit_points": 131, "damage": 28,
                "equip_n": 1, "equip_0": "sword"}})"));

        auto const rng = make_random_state(15);
        auto const w = make_world();

        REQUIRE_THROWS_AS(create_entity(*w, *rng, *db, id_of("troll")), construction_error);
        REQUIRE(w->equipment_count() == 0u);
    }
}

TEST_CASE("data files") {
    using namespace skirmish;

    auto const db = make_game_database(SK_DATA_DIR);

    REQUIRE(db->equipment_definition_count() == 8u);
    REQUIRE(db->entity_definition_count() == 4u);

    auto const rng = make_random_state(16);
    auto const w = make_world();

    for (auto const id : {"hero", "barbarian", "monster", "troll"}) {
        auto const e = create_entity(*w, *rng, *db, id_of(id));
        REQUIRE(is_consistent(*w, w->find(e)));
    }

    REQUIRE(w->entity_count() == 4u);

    REQUIRE_THROWS_AS(make_game_database("/nonexistent"), data_error);
}

#endif // !defined(SK_NO_TESTS)
