#if !defined(SK_NO_TESTS)
#include "catch.hpp"
#include "serialize.hpp"
#include "definition.hpp"
#include "errors.hpp"
#include "hash.hpp"

#include <string>
#include <vector>

namespace {

using namespace skirmish;

struct property_record {
    std::string         name;
    serialize_data_type type;
    uint32_t            value;
};

auto const accept_all = [](string_view, uint32_t, serialize_data_type, uint32_t) noexcept {
    return true;
};

char const equipment_json[] = R"({
  "type": "equipment",
  "data": {
    "sword": {
      "name": "long sword",
      "properties": {
        "category": "weapon",
        "weight": 30,
        "shiny": false,
        "balance": -2.25,
        "note": null
      }
    },
    "purse": {
      "name": "leather purse",
      "properties": {}
    }
  }
})";

} // namespace

TEST_CASE("serialize to_property") {
    using namespace skirmish;

    REQUIRE(to_property(nullptr) == 0u);
    REQUIRE(to_property(true) == 1u);
    REQUIRE(to_property(false) == 0u);
    REQUIRE(to_property(int32_t {-1}) == 0xFFFFFFFFu);
    REQUIRE(to_property(string_view {"weapon"}) == djb2_hash_32c("weapon"));

    REQUIRE(to_property(1.0) == 0x10000u);
    REQUIRE(from_fixed_point(to_property(14.5)) == Approx(14.5));
    REQUIRE(from_fixed_point(to_property(-2.25)) == Approx(-2.25));
}

TEST_CASE("serialize parse equipment") {
    using namespace skirmish;

    std::vector<equipment_definition> defs;
    std::vector<property_record> props;

    parse_equipment_definitions(equipment_json
      , [&](equipment_definition const& def) { defs.push_back(def); }
      , [&](string_view const s, uint32_t const hash, serialize_data_type const type, uint32_t const value) {
            REQUIRE(hash == djb2_hash_32(s.begin(), s.end()));
            props.push_back({std::string {s.data(), s.size()}, type, value});
            return true;
        });

    REQUIRE(defs.size() == 2u);

    auto const& sword = defs[0];
    REQUIRE(sword.id == equipment_id {djb2_hash_32c("sword")});
    REQUIRE(sword.id_string == "sword");
    REQUIRE(sword.name == "long sword");
    REQUIRE(sword.properties.size() == 5u);

    using key = equipment_property_id;
    REQUIRE(sword.properties.value_or(key {djb2_hash_32c("category")}, 0u)
         == djb2_hash_32c("weapon"));
    REQUIRE(sword.properties.value_as_or<int32_t>(key {djb2_hash_32c("weight")}, 0) == 30);
    REQUIRE(sword.properties.value_or(key {djb2_hash_32c("shiny")}, 1u) == 0u);
    REQUIRE(!sword.properties.has_property(key {djb2_hash_32c("damage")}));

    auto const& purse = defs[1];
    REQUIRE(purse.id_string == "purse");
    REQUIRE(purse.properties.empty());

    REQUIRE(props.size() == 5u);
    REQUIRE(props[0].name == "category");
    REQUIRE(props[0].type == serialize_data_type::string);
    REQUIRE((props[1].type == serialize_data_type::u32
          || props[1].type == serialize_data_type::i32));
    REQUIRE(props[2].type == serialize_data_type::boolean);
    REQUIRE(props[3].type == serialize_data_type::float_p);
    REQUIRE(from_fixed_point(props[3].value) == Approx(-2.25));
    REQUIRE(props[4].type == serialize_data_type::null);
}

TEST_CASE("serialize errors") {
    using namespace skirmish;

    auto const ignore_equipment = [](equipment_definition const&) noexcept {};
    auto const ignore_entity    = [](entity_definition const&) noexcept {};

    SECTION("the wrong kind of file") {
        REQUIRE_THROWS_AS(
            parse_entity_definitions(equipment_json, ignore_entity, accept_all)
          , data_error);
    }

    SECTION("a rejected property") {
        auto const reject_shiny = [](string_view const s, uint32_t, serialize_data_type, uint32_t) {
            return s != string_view {"shiny"};
        };

        REQUIRE_THROWS_WITH(
            parse_equipment_definitions(equipment_json, ignore_equipment, reject_shiny)
          , Catch::Matchers::Contains("\"shiny\" was rejected"));
    }

    SECTION("malformed json") {
        REQUIRE_THROWS_WITH(
            parse_equipment_definitions(R"({"type": "equipment", "data": {)"
              , ignore_equipment, accept_all)
          , Catch::Matchers::Contains("{string}"));
    }

    SECTION("nested values") {
        REQUIRE_THROWS_AS(
            parse_equipment_definitions(R"({"type": "equipment", "data": {
                "x": {"name": "x", "properties": {"weight": [1, 2]}}}})"
              , ignore_equipment, accept_all)
          , data_error);
    }

    SECTION("a definition without a name") {
        REQUIRE_THROWS_AS(
            parse_equipment_definitions(R"({"type": "equipment", "data": {
                "x": {"properties": {}}}})"
              , ignore_equipment, accept_all)
          , data_error);
    }

    SECTION("a missing file") {
        REQUIRE_THROWS_AS(
            load_equipment_definitions("/nonexistent/equipment.dat"
              , ignore_equipment, accept_all)
          , data_error);
    }
}

#endif // !defined(SK_NO_TESTS)
