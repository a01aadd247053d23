/**
 * @file control_callback.hpp
 * @brief Caller-facing result sink and the per-action callback multiplexer.
 *
 * @details
 * ## ControlCallback
 * The only thing a caller hands to an operation. It gets exactly one
 * `on_complete(result)` when the action it is attached to terminates. The
 * result values are listed in cec_constants.hpp (RESULT_*), or a power status
 * for the display power query.
 *
 * A callback may signal that its caller is gone by throwing a
 * `std::exception`. The multiplexer logs it and carries on with the next one.
 *
 * ## CallbackList
 * Owned by one action. Callers are attached in order; `deliver()` hands the
 * same value to every attachment once, and closes the list so later `add()`
 * calls are refused. Attaching the same handle twice is allowed and results
 * in two deliveries: each attachment is a separate request.
 */
#pragma once
#include <stddef.h>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace cecflow {

class ControlCallback {
public:
  virtual ~ControlCallback() = default;
  virtual void on_complete(int result) = 0;
};

/// Adapter for a plain function object.
class FunctionCallback : public ControlCallback {
public:
  explicit FunctionCallback(std::function<void(int)> fn) : fn_(std::move(fn)) {}
  void on_complete(int result) override { if (fn_) fn_(result); }
private:
  std::function<void(int)> fn_;
};

/// Shorthand for `std::make_shared<FunctionCallback>(fn)`.
inline std::shared_ptr<ControlCallback> make_callback(std::function<void(int)> fn) {
  return std::make_shared<FunctionCallback>(std::move(fn));
}

class CallbackList {
public:
  /// Attach a caller. Returns false when the list was already delivered or `cb` is null.
  bool add(std::shared_ptr<ControlCallback> cb);

  /**
   * @brief Hand `result` to every attachment, once.
   *
   * Failing callbacks are logged with `owner` as the action label and do
   * not stop the loop. A second call is a no-op.
   *
   * @return Number of callbacks that completed without throwing.
   */
  size_t deliver(int result, const char* owner);

  bool   delivered() const { return delivered_; }
  size_t size() const { return callbacks_.size(); }

private:
  std::vector<std::shared_ptr<ControlCallback>> callbacks_;
  bool delivered_{false};
};

} // namespace cecflow
