#if !defined(SK_NO_TESTS)
#include "catch.hpp"
#include "hash.hpp"

#include <string>

TEST_CASE("djb2_hash") {
    using namespace skirmish;

    constexpr uint32_t empty  {djb2_hash_32c("")};
    constexpr uint32_t t      {djb2_hash_32c("t")};
    constexpr uint32_t test   {djb2_hash_32c("test")};
    constexpr uint32_t weapon {djb2_hash_32c("weapon")};

    REQUIRE(empty == uint32_t {      5381});
    REQUIRE(t     == uint32_t {    177689});
    REQUIRE(test  == uint32_t {2090756197});

    REQUIRE(t      == djb2_hash_32("t"));
    REQUIRE(test   == djb2_hash_32("test"));
    REQUIRE(weapon == djb2_hash_32("weapon"));

    std::string const s {"weapon"};
    REQUIRE(weapon == djb2_hash_32(s.begin(), s.end()));
    REQUIRE(weapon != djb2_hash_32c("weapons"));
}

#endif // !defined(SK_NO_TESTS)
