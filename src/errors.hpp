#pragma once

#include <stdexcept>
#include <string>

namespace skirmish {

//! An entity or item could not be created from the arguments given; nothing
//! was registered or attached.
struct construction_error : std::invalid_argument {
    using invalid_argument::invalid_argument;
};

//! A combat operation was given arguments it cannot act on.
struct combat_error : std::invalid_argument {
    using invalid_argument::invalid_argument;
};

//! A combat operation is missing a participant.
struct null_target_error : combat_error {
    using combat_error::combat_error;
};

//! A data file could not be opened or parsed.
struct data_error : std::runtime_error {
    using runtime_error::runtime_error;
};

} //namespace skirmish
