#include "combat.hpp"
#include "context.hpp"
#include "data.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "hash.hpp"
#include "inventory.hpp"
#include "message_log.hpp"
#include "random.hpp"
#include "world.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cinttypes>

namespace skirmish {

//~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
// Command line: skirmish [hero-id] [monster-id] [seed] [data-dir]
//~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
struct options {
    std::string hero     {"hero"};
    std::string monster  {"monster"};
    uint64_t    seed     {0}; // from the clock
    std::string data_dir {"./data"};
};

options parse_options(int const argc, char const* const argv[]) {
    options result;

    if (argc > 5) {
        throw std::invalid_argument {"usage: skirmish [hero-id] [monster-id] [seed] [data-dir]"};
    }

    if (argc > 1) { result.hero    = argv[1]; }
    if (argc > 2) { result.monster = argv[2]; }

    if (argc > 3) {
        char* last = nullptr;
        errno = 0;
        result.seed = std::strtoull(argv[3], &last, 10);
        if (errno != 0 || last == argv[3] || *last != '\0') {
            throw std::invalid_argument {std::string {"bad seed \""} + argv[3] + "\""};
        }
    }

    if (argc > 4) { result.data_dir = argv[4]; }

    return result;
}

entity_id find_entity_definition(game_database const& db, std::string const& id_string) {
    auto const id = entity_id {djb2_hash_32(id_string.c_str())};
    if (!db.find(id)) {
        throw data_error {"no entity is defined as \"" + id_string + "\""};
    }

    return id;
}

void print_entity(const_context const ctx, entity const& e) {
    std::printf("%s (%s): %d/%d hit points, protection %d, carrying %" PRId64 " of %d\n"
      , e.name().c_str(), to_string(e.category())
      , e.hit_points(), e.max_hit_points()
      , effective_protection(ctx, e)
      , total_weight(ctx, e), e.capacity());

    for (auto const& a : e.anchors()) {
        if (a.is_free()) {
            continue;
        }

        auto const& itm = ctx.w.find(a.item);

        static_string_buffer<64> name;
        name_of(itm, name);

        std::printf("  %-10s %s, worth %" PRId64 "%s\n"
          , a.name.empty() ? "-" : a.name.c_str()
          , name.data(), current_value(ctx, itm)
          , itm.is_destroyed() ? " (destroyed)" : "");
    }
}

int run(int const argc, char const* const argv[]) {
    auto const opts = parse_options(argc, argv);

    auto const seed = opts.seed != 0
      ? opts.seed
      : static_cast<uint64_t>(
            std::chrono::system_clock::now().time_since_epoch().count());

    std::printf("Seed %" PRIu64 ".\n", seed);

    auto const db    = make_game_database(opts.data_dir);
    auto const rng   = make_random_state(seed);
    auto const w     = make_world();
    auto const log   = make_message_log(stdout);

    auto const hero    = create_entity(*w, *rng, *db
      , find_entity_definition(*db, opts.hero));
    auto const monster = create_entity(*w, *rng, *db
      , find_entity_definition(*db, opts.monster));

    context const ctx {*w};

    print_entity(ctx, w->find(hero));
    print_entity(ctx, w->find(monster));

    battle b {ctx, hero, monster};
    auto const winner = b.fight(*rng, *log);

    print_entity(ctx, w->find(winner));

    return 0;
}

} //namespace skirmish

int main(int const argc, char const* argv[]) try {
    return skirmish::run(argc, argv);
} catch (std::exception const& e) {
    std::printf("Failed: %s.\n", e.what());
    return 1;
} catch (...) {
    std::printf("Unexpected failure.\n");
    return 1;
}
