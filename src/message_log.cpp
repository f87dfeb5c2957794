#include "message_log.hpp"
#include "format.hpp"

#include <utility>

namespace skirmish {

message_log::~message_log() = default;

class message_log_impl final : public message_log {
public:
    explicit message_log_impl(std::FILE* const echo)
      : echo_ {echo}
    {
    }

    void print(std::string msg) final override {
        current_.append(msg);
    }

    void println(std::string msg) final override;

    size_t size() const noexcept final override {
        return lines_.size();
    }

    std::string const* begin() const noexcept final override {
        return lines_.data();
    }

    std::string const* end() const noexcept final override {
        return lines_.data() + lines_.size();
    }
private:
    std::FILE*               echo_;
    std::string              current_;
    std::vector<std::string> lines_;
};

void message_log_impl::println(std::string msg) {
    current_.append(msg);
    lines_.push_back(std::move(current_));
    current_.clear();

    if (echo_) {
        std::fprintf(echo_, "%s\n", lines_.back().c_str());
    }
}

std::unique_ptr<message_log> make_message_log(std::FILE* const echo) {
    return std::make_unique<message_log_impl>(echo);
}

void println(message_log& log, string_buffer_base const& buffer) {
    log.println(buffer.to_string());
}

} //namespace skirmish
