#pragma once
#include <handoff/core.hpp>
#include <type_traits>
#include <utility>

namespace handoff_test {

struct drop_counter {
  int drops = 0;
  int clones = 0;
  int moves = 0;
};

/**
 * Token reporting its lifecycle to a drop_counter. A moved-from token gives up
 * its counter, so destroying the husk is not a drop. Relocating a relocatable
 * token into storage (relocate_at, relocate_n) is a byte copy and records
 * nothing; relocating it into a returned value records one move.
 */
template <bool Relocatable> class basic_drop_token {
  drop_counter *counter_;
  int id_;

public:
  explicit basic_drop_token(drop_counter &counter, int id = 0) noexcept
      : counter_(&counter), id_(id) {}

  basic_drop_token(const basic_drop_token &other) noexcept
      : counter_(other.counter_), id_(other.id_) {
    if (counter_)
      ++counter_->clones;
  }

  basic_drop_token(basic_drop_token &&other) noexcept
      : counter_(std::exchange(other.counter_, nullptr)), id_(other.id_) {
    if (counter_)
      ++counter_->moves;
  }

  basic_drop_token &operator=(const basic_drop_token &) = delete;
  basic_drop_token &operator=(basic_drop_token &&) = delete;

  ~basic_drop_token() {
    if (counter_)
      ++counter_->drops;
  }

  [[nodiscard]] int id() const noexcept { return id_; }
  [[nodiscard]] bool live() const noexcept { return counter_ != nullptr; }
};

using drop_token = basic_drop_token<false>;
using relocatable_token = basic_drop_token<true>;

} // namespace handoff_test

namespace handoff {
template <bool Relocatable>
struct is_relocatable<handoff_test::basic_drop_token<Relocatable>>
    : std::bool_constant<Relocatable> {};
} // namespace handoff
