#pragma once

#if !defined(SK_NO_TESTS)
#   include <catch2/catch.hpp>
#endif // SK_NO_TESTS

namespace skirmish {

//! Run every registered test case with the given command line.
//! @returns The number of failed tests.
int run_unit_tests(int argc, char const* const* argv);

} //namespace skirmish
