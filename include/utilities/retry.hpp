#pragma once
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include <chrono>
#include <string>
#include <thread>

namespace chunkkeeper {

/**
 * @brief Run @p fn, retrying transient StorageError failures.
 *
 * The delay doubles after every failed attempt starting at @p baseDelay.
 * Non-transient errors, and the last transient one, propagate to the caller.
 *
 * @param what       Operation description used in log lines.
 * @param maxRetries Number of retries after the first attempt.
 */
template <typename Fn>
auto retryWithBackoff(const std::string &what, Fn &&fn, int maxRetries,
                      std::chrono::milliseconds baseDelay) -> decltype(fn()) {
  auto delay = baseDelay;
  for (int attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const StorageError &e) {
      if (!e.transient() || attempt >= maxRetries)
        throw;
      Logger::getInstance().log(
          LogLevel::WARN, "[Retry] " + what + " failed (attempt " +
                              std::to_string(attempt + 1) + "): " + e.what() +
                              ". Retrying in " + std::to_string(delay.count()) +
                              "ms");
      std::this_thread::sleep_for(delay);
      delay *= 2;
    }
  }
}

} // namespace chunkkeeper
