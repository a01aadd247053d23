/**
 * @file action_timer.hpp
 * @brief Timer tokens and the fixed-capacity deadline queue that drives action timeouts.
 *
 * @details
 * ## Tokens
 * A timer is armed for a *state occurrence*, not just a state value. Every
 * time an action enters a state (even the same one again) its generation
 * counter moves on, so a token armed before the re-entry can never match the
 * action's current occurrence. That is what makes a late timer harmless.
 *
 * ## Queue
 * `ActionTimerQueue` holds at most one entry per action: arming again replaces
 * the previous entry. `pop_due()` removes every entry whose deadline has passed
 * and hands them back ordered by deadline, then by arming order. The queue
 * does not call anyone; the local device routes each popped entry to its
 * owning action.
 *
 * Time is the 64-bit uptime in milliseconds kept by LocalDevice::tick().
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include "etl/vector.h"

namespace cecflow {

struct TimerToken {
  uint8_t  state{0};        ///< State value the timer was armed for.
  uint32_t generation{0};   ///< Occurrence of that state.

  bool operator==(const TimerToken& o) const {
    return state == o.state && generation == o.generation;
  }
  bool operator!=(const TimerToken& o) const { return !(*this == o); }
};

class ActionTimerQueue {
public:
  static constexpr size_t CAPACITY = 8;   ///< one slot per live action

  struct Entry {
    uint32_t   action_id{0};
    TimerToken token{};
    uint64_t   deadline_ms{0};
    uint64_t   seq{0};        ///< arming order, breaks deadline ties
  };

  using DueList = etl::vector<Entry, CAPACITY>;

  /**
   * @brief Arm (or re-arm) the timer of `action_id`.
   * @return false when the queue is full and the action has no entry yet.
   */
  bool arm(uint32_t action_id, const TimerToken& token, uint64_t deadline_ms);

  /// Disarm the timer of `action_id`. Returns false when none was armed.
  bool cancel(uint32_t action_id);

  bool is_armed(uint32_t action_id) const;

  /// Token currently armed for `action_id`, if any.
  bool armed_token(uint32_t action_id, TimerToken& out) const;

  /// Remove and return every entry with `deadline_ms <= now_ms`.
  size_t pop_due(uint64_t now_ms, DueList& out);

  /// Earliest pending deadline; false when the queue is empty.
  bool next_deadline(uint64_t& out) const;

  size_t size() const { return entries_.size(); }
  bool   empty() const { return entries_.empty(); }

private:
  etl::vector<Entry, CAPACITY> entries_;
  uint64_t next_seq_{0};
};

} // namespace cecflow
