#pragma once

#include "bkassert/assert.hpp"

#include <memory>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace skirmish {

//! Block storage addressed by 1-based ids. Every block is separately
//! allocated, so references to live blocks remain valid while other blocks
//! are allocated or freed. Freed ids are handed out again.
//! @note this does not conform to the stl allocator interface
template <typename T>
class stable_block_storage {
public:
    //! The id the next call to allocate will return.
    size_t next_block_id() const noexcept {
        return free_.empty() ? blocks_.size() + 1 : free_.back();
    }

    template <typename... Args>
    std::pair<T*, size_t> allocate(Args&&... args) {
        auto block = std::make_unique<T>(std::forward<Args>(args)...);
        auto const p = block.get();

        if (free_.empty()) {
            blocks_.push_back(std::move(block));
            return {p, blocks_.size()};
        }

        auto const id = free_.back();
        blocks_[id - 1] = std::move(block);
        free_.pop_back();

        return {p, id};
    }

    //! free the block with the given id by calling its destructor
    void deallocate(size_t const id) noexcept {
        BK_ASSERT(is_allocated(id));
        blocks_[id - 1].reset();
        free_.push_back(id);
    }

    bool is_allocated(size_t const id) const noexcept {
        return id >= 1 && id <= blocks_.size() && !!blocks_[id - 1];
    }

    size_t capacity() const noexcept { return blocks_.size(); }
    size_t size()     const noexcept { return blocks_.size() - free_.size(); }

    T*       find(size_t const id)       noexcept { return is_allocated(id) ? blocks_[id - 1].get() : nullptr; }
    T const* find(size_t const id) const noexcept { return is_allocated(id) ? blocks_[id - 1].get() : nullptr; }

    T&       operator[](size_t const id)       noexcept { return *blocks_[id - 1]; }
    T const& operator[](size_t const id) const noexcept { return *blocks_[id - 1]; }

    template <typename F>
    void for_each(F&& f) const {
        for (auto const& block : blocks_) {
            if (block) {
                f(*block);
            }
        }
    }
private:
    std::vector<std::unique_ptr<T>> blocks_;
    std::vector<size_t>             free_;
};

} //namespace skirmish
