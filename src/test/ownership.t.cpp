#if !defined(SK_NO_TESTS)
#include "catch.hpp"
#include "create.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "inventory.hpp"
#include "ownership.hpp"
#include "random.hpp"
#include "types.hpp"
#include "world.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

using namespace skirmish;

struct fixture {
    fixture()
      : state {make_random_state(99)}
      , rng   {*state}
      , w     {make_world()}
    {
    }

    entity_instance_id hero(std::string name = "Aragorn", double const strength = 12.5) {
        hero_params params;
        params.name           = std::move(name);
        params.max_hit_points = 100;
        params.strength       = strength;
        return create_hero(*w, params);
    }

    entity_instance_id monster(int32_t const anchors, int32_t const spare = 100) {
        monster_params params;
        params.name           = "Cave Troll";
        params.max_hit_points = 50;
        params.damage         = 14;
        params.anchors        = anchors;
        params.spare_capacity = spare;
        return create_monster(*w, params);
    }

    equipment_instance_id weapon(int32_t const weight = 10) {
        return create_weapon(*w, rng, weight, 100, 14);
    }

    equipment_instance_id armor(int32_t const weight = 20) {
        return create_armor(*w, rng, weight, 100, armor_type::tin);
    }

    equipment_instance_id purse(int32_t const contents = 0) {
        return create_purse(*w, rng, 1, 100, contents);
    }

    equipment_instance_id backpack(int32_t const capacity = 100) {
        return create_backpack(*w, rng, 5, 50, capacity);
    }

    bool set_owner(equipment_instance_id const itm, entity_instance_id const e) {
        reason.clear();
        return try_set_owner(*w, itm, e, reason);
    }

    bool set_backpack(equipment_instance_id const itm, equipment_instance_id const b) {
        reason.clear();
        return try_set_backpack(*w, itm, b, reason);
    }

    bool consistent() const {
        bool ok = true;
        w->for_each_equipment([&](equipment const& itm) {
            ok = ok && is_consistent(*w, itm);
        });
        w->for_each_entity([&](entity const& e) {
            ok = ok && is_consistent(*w, e);
        });
        return ok;
    }

    std::unique_ptr<random_state> state;
    random_state&                 rng;
    std::unique_ptr<world>        w;
    static_string_buffer<256>     reason;
};

} // namespace

TEST_CASE("ownership hero anchors") {
    fixture f;

    auto const h = f.hero();
    auto const& hero = f.w->find(h);

    auto const w0 = f.weapon();
    auto const w1 = f.weapon();
    auto const w2 = f.weapon();
    auto const w3 = f.weapon();

    REQUIRE(f.set_owner(w0, h));
    REQUIRE(f.set_owner(w1, h));
    REQUIRE(f.set_owner(w2, h));

    REQUIRE(hero.left_hand() == w0);
    REQUIRE(hero.right_hand() == w1);
    REQUIRE(hero.anchor(index_of(hero_anchor::back)).item == w2);

    REQUIRE(f.w->find(w0).owner() == h);
    REQUIRE(hero.has_item(w0));
    REQUIRE(f.consistent());

    SECTION("no free anchor accepts a fourth weapon") {
        REQUIRE(!f.set_owner(w3, h));
        REQUIRE(!f.reason.empty());
        REQUIRE(f.w->find(w3).owner() == nullptr);
        REQUIRE(!hero.has_item(w3));
    }

    SECTION("setting the same owner again does nothing") {
        REQUIRE(f.set_owner(w0, h));
        REQUIRE(hero.left_hand() == w0);
        REQUIRE(f.consistent());
    }

    SECTION("releasing") {
        REQUIRE(f.set_owner(w0, entity_instance_id {}));
        REQUIRE(f.w->find(w0).owner() == nullptr);
        REQUIRE(hero.left_hand() == nullptr);
        REQUIRE(hero.anchor(index_of(hero_anchor::left_hand)).is_free());
        REQUIRE(f.consistent());
    }

    SECTION("moving to a specific anchor") {
        REQUIRE(f.set_owner(w0, entity_instance_id {}));

        f.reason.clear();
        REQUIRE(!try_equip(*f.w, w3, h, index_of(hero_anchor::body), f.reason));
        REQUIRE(!try_equip(*f.w, w3, h, index_of(hero_anchor::right_hand), f.reason));
        REQUIRE(!try_equip(*f.w, w3, h, 17, f.reason));

        REQUIRE(try_equip(*f.w, w3, h, index_of(hero_anchor::left_hand), f.reason));
        REQUIRE(hero.left_hand() == w3);
        REQUIRE(f.consistent());
    }
}

TEST_CASE("ownership hero limits") {
    fixture f;

    auto const h = f.hero();
    auto const& hero = f.w->find(h);

    SECTION("at most two armors") {
        auto const a0 = f.armor();
        auto const a1 = f.armor();
        auto const a2 = f.armor();

        REQUIRE(f.set_owner(a0, h));
        REQUIRE(f.set_owner(a1, h));
        REQUIRE(hero.armor() == a0);
        REQUIRE(hero.anchor(index_of(hero_anchor::back)).item == a1);

        REQUIRE(!f.set_owner(a2, h));
        REQUIRE(count_held(*f.w, hero, equipment_category::armor) == 2);
    }

    SECTION("at most one purse") {
        auto const p0 = f.purse();
        auto const p1 = f.purse();

        REQUIRE(f.set_owner(p0, h));
        REQUIRE(hero.anchor(index_of(hero_anchor::belt)).item == p0);
        REQUIRE(!f.set_owner(p1, h));
    }

    SECTION("a purse may go on the back") {
        auto const p0 = f.purse();
        auto const p1 = f.purse();

        f.reason.clear();
        REQUIRE(try_equip(*f.w, p0, h, index_of(hero_anchor::back), f.reason));
        REQUIRE(hero.anchor(index_of(hero_anchor::back)).item == p0);
        REQUIRE(hero.anchor(index_of(hero_anchor::belt)).is_free());

        // still only one purse
        REQUIRE(!try_equip(*f.w, p1, h, index_of(hero_anchor::belt), f.reason));
        REQUIRE(f.consistent());
    }

    SECTION("armor goes on the body") {
        auto const a0 = f.armor();
        auto const w0 = f.weapon();

        f.reason.clear();
        REQUIRE(!try_equip_armor(*f.w, h, w0, f.reason));
        REQUIRE(try_equip_armor(*f.w, h, a0, f.reason));
        REQUIRE(hero.armor() == a0);
    }

    SECTION("capacity") {
        // 12.5 strength carries 250
        auto const heavy = f.weapon(240);
        auto const light = f.weapon(10);
        auto const extra = f.weapon(1);

        REQUIRE(f.set_owner(heavy, h));
        REQUIRE(f.set_owner(light, h));
        REQUIRE(total_weight(*f.w, hero) == 250);

        REQUIRE(!f.set_owner(extra, h));
        REQUIRE(f.w->find(extra).owner() == nullptr);
        REQUIRE(f.consistent());
    }

    SECTION("coins weigh") {
        auto const p = f.purse(5);
        REQUIRE(total_weight(*f.w, f.w->find(p)) == 1 + 5 * purse_weight_per_dukat);
        REQUIRE(!f.set_owner(p, h));

        f.w->find(p).remove_from_contents(1);
        REQUIRE(f.set_owner(p, h));
        REQUIRE(total_weight(*f.w, hero) == 201);
    }
}

TEST_CASE("ownership between entities") {
    fixture f;

    auto const h0 = f.hero("Aragorn");
    auto const h1 = f.hero("Legolas");

    auto const w0 = f.weapon();
    auto const w1 = f.weapon();

    SECTION("two items can have two different owners at once") {
        REQUIRE(f.set_owner(w0, h0));
        REQUIRE(f.set_owner(w1, h1));

        REQUIRE(f.w->find(w0).owner() == h0);
        REQUIRE(f.w->find(w1).owner() == h1);
        REQUIRE(f.w->find(h0).has_item(w0));
        REQUIRE(!f.w->find(h0).has_item(w1));
        REQUIRE(f.consistent());
    }

    SECTION("changing hands updates both sides") {
        REQUIRE(f.set_owner(w0, h0));
        REQUIRE(f.set_owner(w0, h1));

        REQUIRE(f.w->find(w0).owner() == h1);
        REQUIRE(!f.w->find(h0).has_item(w0));
        REQUIRE(f.w->find(h0).left_hand() == nullptr);
        REQUIRE(f.w->find(h1).left_hand() == w0);
        REQUIRE(f.consistent());
    }

    SECTION("monsters take anything at any anchor") {
        auto const m = f.monster(2);
        auto const p = f.purse();

        REQUIRE(f.set_owner(p, m));
        REQUIRE(f.set_owner(w0, m));
        REQUIRE(!f.set_owner(w1, m));
        REQUIRE(f.w->find(m).anchor(0).item == p);
        REQUIRE(f.consistent());
    }

    SECTION("missing objects") {
        REQUIRE(!f.set_owner(equipment_instance_id {uint32_t {999}}, h0));
        REQUIRE(!f.set_owner(w0, entity_instance_id {uint32_t {999}}));
        REQUIRE(!f.reason.empty());
    }
}

TEST_CASE("ownership backpacks") {
    fixture f;

    auto const h = f.hero();
    auto const& hero = f.w->find(h);

    auto const b0 = f.backpack(100);
    auto const b1 = f.backpack(50);
    auto const w0 = f.weapon(10);

    REQUIRE(f.set_owner(w0, h));
    REQUIRE(f.set_owner(b0, h));

    SECTION("an item put in a backpack leaves its anchor") {
        REQUIRE(f.set_backpack(w0, b0));

        auto const& itm = f.w->find(w0);
        REQUIRE(itm.container() == b0);
        REQUIRE(itm.owner() == nullptr);
        REQUIRE(!hero.has_item(w0));
        REQUIRE(hero.left_hand() == nullptr);
        REQUIRE(f.w->find(b0).items().contains(w0));
        REQUIRE(effective_owner(*f.w, itm) == h);
        REQUIRE(total_weight(*f.w, hero) == 5 + 10);
        REQUIRE(f.consistent());

        SECTION("and back") {
            REQUIRE(f.set_owner(w0, h));
            REQUIRE(itm.container() == nullptr);
            REQUIRE(!f.w->find(b0).items().contains(w0));
            REQUIRE(hero.left_hand() == w0);
            REQUIRE(f.consistent());
        }

        SECTION("out of the backpack") {
            REQUIRE(f.set_backpack(w0, equipment_instance_id {}));
            REQUIRE(itm.container() == nullptr);
            REQUIRE(itm.owner() == nullptr);
            REQUIRE(f.consistent());
        }
    }

    SECTION("nesting") {
        REQUIRE(f.set_backpack(b1, b0));
        REQUIRE(f.set_backpack(w0, b1));
        REQUIRE(is_inside(*f.w, f.w->find(w0), b0));
        REQUIRE(total_weight(*f.w, f.w->find(b0)) == 5 + 5 + 10);
        REQUIRE(current_value(*f.w, f.w->find(b0)) == 50 + 50 + 28);

        SECTION("no cycles") {
            REQUIRE(!f.set_backpack(b0, b1));
            REQUIRE(!f.set_backpack(b0, b0));
            REQUIRE(f.w->find(b0).container() == nullptr);
        }

        SECTION("moving from an inner to an outer backpack") {
            REQUIRE(f.set_backpack(w0, b0));
            REQUIRE(f.w->find(w0).container() == b0);
            REQUIRE(!f.w->find(b1).items().contains(w0));
            REQUIRE(f.consistent());
        }

        REQUIRE(f.consistent());
    }

    SECTION("capacity") {
        auto const heavy = f.weapon(96);
        REQUIRE(!f.set_backpack(heavy, b1));

        auto const small = f.backpack(5);
        REQUIRE(!f.set_backpack(w0, small));
        REQUIRE(f.w->find(w0).owner() == h);
    }

    SECTION("only backpacks hold things") {
        auto const w1 = f.weapon();
        REQUIRE(!f.set_backpack(w1, w0));
    }

    SECTION("the carrier must manage the weight") {
        REQUIRE(f.set_owner(b0, entity_instance_id {}));

        auto const big = f.backpack(1000);
        REQUIRE(f.set_owner(big, h));

        auto const heavy = f.weapon(240);
        REQUIRE(!f.set_backpack(heavy, big));

        auto const fits = f.weapon(200);
        REQUIRE(f.set_backpack(fits, big));
        REQUIRE(total_weight(*f.w, hero) == 10 + 5 + 200);
    }
}

TEST_CASE("ownership destroy") {
    fixture f;

    auto const h  = f.hero();
    auto const b  = f.backpack();
    auto const w0 = f.weapon();

    REQUIRE(f.set_owner(b, h));
    REQUIRE(f.set_backpack(w0, b));

    destroy(*f.w, b);

    auto const& backpack = f.w->find(b);
    REQUIRE(backpack.is_destroyed());
    REQUIRE(backpack.items().empty());
    REQUIRE(f.w->find(w0).container() == nullptr);
    REQUIRE(!f.w->find(w0).is_destroyed());

    // still held
    REQUIRE(backpack.owner() == h);

    SECTION("twice") {
        destroy(*f.w, b);
        REQUIRE(backpack.is_destroyed());
    }

    SECTION("a destroyed backpack takes nothing") {
        REQUIRE(!f.set_backpack(w0, b));
    }

    SECTION("a destroyed purse loses its coins") {
        auto const p = f.purse(20);
        destroy(*f.w, p);
        REQUIRE(f.w->find(p).contents() == 0);
    }

    REQUIRE(f.consistent());
}

TEST_CASE("ownership creation with a loadout") {
    fixture f;

    auto const w0 = f.weapon();
    auto const a0 = f.armor();
    auto const p0 = f.purse();

    hero_params params;
    params.name           = "Aragorn";
    params.max_hit_points = 100;
    params.strength       = 12.5;

    SECTION("items go to the first anchor that takes them") {
        auto const h = create_hero(*f.w, params, {p0, a0, w0});
        auto const& hero = f.w->find(h);

        REQUIRE(hero.left_hand() == w0);
        REQUIRE(hero.armor() == a0);
        REQUIRE(hero.anchor(index_of(hero_anchor::belt)).item == p0);
        REQUIRE(f.consistent());
    }

    SECTION("an item that belongs to someone else") {
        auto const other = f.hero("Legolas");
        REQUIRE(f.set_owner(w0, other));

        auto const count = f.w->entity_count();
        REQUIRE_THROWS_AS(create_hero(*f.w, params, {a0, w0}), construction_error);
        REQUIRE(f.w->entity_count() == count);
        REQUIRE(f.w->find(w0).owner() == other);
        REQUIRE(f.w->find(a0).owner() == nullptr);
    }

    SECTION("an item listed twice") {
        REQUIRE_THROWS_AS(create_hero(*f.w, params, {w0, w0}), construction_error);
        REQUIRE(f.w->entity_count() == 0u);
    }

    SECTION("a failure part way through undoes everything") {
        auto const heavy = f.weapon(250);
        REQUIRE_THROWS_AS(create_hero(*f.w, params, {w0, heavy}), construction_error);

        REQUIRE(f.w->entity_count() == 0u);
        REQUIRE(f.w->find(w0).owner() == nullptr);
        REQUIRE(f.w->find(heavy).owner() == nullptr);
        REQUIRE(f.consistent());
    }

    SECTION("monsters hold their loadout in order") {
        monster_params m;
        m.name           = "Cave Troll";
        m.max_hit_points = 50;
        m.damage         = 14;
        m.anchors        = 3;

        auto const id = create_monster(*f.w, m, {p0, w0});
        auto const& monster = f.w->find(id);

        REQUIRE(monster.anchor(0).item == p0);
        REQUIRE(monster.anchor(1).item == w0);
        REQUIRE(monster.anchor(2).is_free());
        REQUIRE(monster.capacity() == total_weight(*f.w, monster));
        REQUIRE(f.consistent());

        SECTION("and no more than they have anchors for") {
            m.anchors = 1;
            REQUIRE_THROWS_AS(create_monster(*f.w, m, {a0, f.weapon()}), construction_error);
        }
    }
}

TEST_CASE("ownership random operations") {
    for (uint64_t seed = 1; seed <= 64; ++seed) {
        fixture f;
        auto const ops = make_random_state(seed);
        auto& rng = *ops;

        std::vector<entity_instance_id> entities {
            f.hero("Aragorn", 12.5)
          , f.hero("Conan: the Barbarian", 4.0)
          , f.monster(2, 60)
          , f.monster(3, 200)
        };

        std::vector<equipment_instance_id> items;
        std::vector<equipment_instance_id> backpacks;

        for (int i = 0; i < 4; ++i) {
            items.push_back(f.weapon(random_uniform_int(rng, 1, 40)));
            items.push_back(f.armor(random_uniform_int(rng, 1, 60)));
            items.push_back(f.purse(random_uniform_int(rng, 0, 2)));
        }

        for (int i = 0; i < 4; ++i) {
            auto const b = f.backpack(random_uniform_int(rng, 5, 120));
            items.push_back(b);
            backpacks.push_back(b);
        }

        auto const pick = [&](auto const& v) {
            return v[static_cast<size_t>(
                random_uniform_int(rng, 0, static_cast<int32_t>(v.size()) - 1))];
        };

        for (int step = 0; step < 300; ++step) {
            auto const itm = pick(items);

            switch (random_uniform_int(rng, 0, 9)) {
            case 0: case 1: case 2:
                f.set_owner(itm, pick(entities));
                break;
            case 3:
                f.set_owner(itm, entity_instance_id {});
                break;
            case 4: case 5: case 6: {
                auto const b = pick(backpacks);
                if (f.set_backpack(itm, b)) {
                    auto const& backpack = f.w->find(b);
                    REQUIRE(contained_weight(*f.w, backpack) <= backpack.capacity());
                    REQUIRE(f.w->find(itm).container() == b);
                }
                break;
            }
            case 7:
                f.set_backpack(itm, equipment_instance_id {});
                break;
            case 8: {
                f.reason.clear();
                auto const i = static_cast<size_t>(random_uniform_int(rng, 0, 5));
                try_equip(*f.w, itm, pick(entities), i, f.reason);
                break;
            }
            default:
                if (random_chance_in_x(rng, 1, 4)) {
                    destroy(*f.w, itm);
                }
                break;
            }

            REQUIRE(f.consistent());

            for (auto const id : entities) {
                auto const& e = f.w->find(id);
                REQUIRE(total_weight(*f.w, e) <= e.capacity());

                if (e.is_a(entity_category::hero)) {
                    REQUIRE(count_held(*f.w, e, equipment_category::armor) <= hero_max_armors);
                    REQUIRE(count_held(*f.w, e, equipment_category::purse) <= hero_max_purses);
                }
            }

            for (auto const id : backpacks) {
                auto const& b = f.w->find(id);
                REQUIRE(contained_weight(*f.w, b) <= b.capacity());
            }

            auto const& moved = f.w->find(itm);
            REQUIRE((moved.owner() == nullptr || moved.container() == nullptr));
        }
    }
}

#endif // !defined(SK_NO_TESTS)
