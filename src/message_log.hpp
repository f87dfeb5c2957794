#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdio>
#include <cstddef>

namespace skirmish { class string_buffer_base; }

namespace skirmish {

//! Narration of everything that happens during a simulation.
class message_log {
public:
    virtual ~message_log();

    //! Append to the line currently being built.
    virtual void print(std::string msg) = 0;

    //! Append to and then complete the current line.
    virtual void println(std::string msg) = 0;

    virtual size_t size() const noexcept = 0;

    virtual std::string const* begin() const noexcept = 0;
    virtual std::string const* end() const noexcept = 0;
};

//! A log that keeps every completed line and, if @p echo is not null, also
//! writes each one to it.
std::unique_ptr<message_log> make_message_log(std::FILE* echo = nullptr);

void println(message_log& log, string_buffer_base const& buffer);

} //namespace skirmish
