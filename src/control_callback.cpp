// -----------------------------------------------------------------------------
// control_callback.cpp: CallbackList delivery
// -----------------------------------------------------------------------------
#include "cecflow/control_callback.hpp"
#include "cecflow/log.hpp"

#include <exception>

namespace cecflow {

bool CallbackList::add(std::shared_ptr<ControlCallback> cb) {
  if (!cb || delivered_) return false;
  callbacks_.push_back(std::move(cb));
  return true;
}

size_t CallbackList::deliver(int result, const char* owner) {
  if (delivered_) return 0;
  delivered_ = true;   // closed before the first call; a callback may re-enter the device

  // move out so a re-entrant caller cannot grow the list we are walking
  std::vector<std::shared_ptr<ControlCallback>> targets;
  targets.swap(callbacks_);

  size_t ok = 0;
  for (size_t i = 0; i < targets.size(); ++i) {
    try {
      targets[i]->on_complete(result);
      ++ok;
    } catch (const std::exception& e) {
      log_error("action=", owner, " event=callback_failed index=", i,
                " result=", result, " what=", e.what());
    } catch (...) {
      log_error("action=", owner, " event=callback_failed index=", i,
                " result=", result, " what=unknown");
    }
  }
  log_debug("action=", owner, " event=callbacks_delivered result=", result,
            " count=", targets.size(), " ok=", ok);
  return ok;
}

} // namespace cecflow
