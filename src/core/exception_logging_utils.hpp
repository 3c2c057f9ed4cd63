#pragma once

#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace gpusched {

struct ExceptionLoggingMessages {
  std::string_view context_prefix;
};

// Runs one iteration of a background loop; a failure is logged and the
// caller carries on with the next iteration.
template <typename Callback>
void
run_with_logged_exceptions(
    Callback&& callback,
    const ExceptionLoggingMessages& messages = ExceptionLoggingMessages{})
{
  try {
    std::forward<Callback>(callback)();
  }
  catch (const GpuSchedulerException& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  catch (const std::bad_alloc& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  catch (const std::exception& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
}

}  // namespace gpusched
