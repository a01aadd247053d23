// -----------------------------------------------------------------------------
// action_timer.cpp: ActionTimerQueue
//
// Linear scans over at most CAPACITY entries; no allocation.
// -----------------------------------------------------------------------------
#include "cecflow/action_timer.hpp"

#include <algorithm>

namespace cecflow {

bool ActionTimerQueue::arm(uint32_t action_id, const TimerToken& token, uint64_t deadline_ms) {
  for (auto& e : entries_) {
    if (e.action_id == action_id) {          // one timer per action: replace
      e.token = token;
      e.deadline_ms = deadline_ms;
      e.seq = next_seq_++;
      return true;
    }
  }
  if (entries_.full()) return false;

  Entry e;
  e.action_id = action_id;
  e.token = token;
  e.deadline_ms = deadline_ms;
  e.seq = next_seq_++;
  entries_.push_back(e);
  return true;
}

bool ActionTimerQueue::cancel(uint32_t action_id) {
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].action_id == action_id) {
      entries_.erase(entries_.begin() + i);
      return true;
    }
  }
  return false;
}

bool ActionTimerQueue::is_armed(uint32_t action_id) const {
  for (const auto& e : entries_) if (e.action_id == action_id) return true;
  return false;
}

bool ActionTimerQueue::armed_token(uint32_t action_id, TimerToken& out) const {
  for (const auto& e : entries_) {
    if (e.action_id == action_id) { out = e.token; return true; }
  }
  return false;
}

size_t ActionTimerQueue::pop_due(uint64_t now_ms, DueList& out) {
  out.clear();
  size_t i = 0;
  while (i < entries_.size()) {
    if (entries_[i].deadline_ms <= now_ms) {
      out.push_back(entries_[i]);
      entries_.erase(entries_.begin() + i);
    } else {
      ++i;
    }
  }
  std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) {
    if (a.deadline_ms != b.deadline_ms) return a.deadline_ms < b.deadline_ms;
    return a.seq < b.seq;
  });
  return out.size();
}

bool ActionTimerQueue::next_deadline(uint64_t& out) const {
  if (entries_.empty()) return false;
  uint64_t best = entries_[0].deadline_ms;
  for (const auto& e : entries_) best = std::min(best, e.deadline_ms);
  out = best;
  return true;
}

} // namespace cecflow
