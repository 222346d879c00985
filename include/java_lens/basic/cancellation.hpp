// java_lens/basic/cancellation.hpp - Cooperative cancellation signal
#pragma once

#include <atomic>

namespace java_lens
{

/**
 * Pollable cancellation flag owned by the host.
 *
 * Analysis code only reads the flag at iteration boundaries (per file in
 * multi-file scans, before a parse in the cache path). It never waits on it.
 */
class CancellationFlag
{
public:
  CancellationFlag() = default;

  CancellationFlag(const CancellationFlag &) = delete;
  CancellationFlag & operator=(const CancellationFlag &) = delete;

  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

  [[nodiscard]] bool is_cancelled() const noexcept
  {
    return cancelled_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> cancelled_{false};
};

/// True when a flag is supplied and has been raised.
[[nodiscard]] inline bool is_cancelled(const CancellationFlag * flag) noexcept
{
  return flag != nullptr && flag->is_cancelled();
}

}  // namespace java_lens
