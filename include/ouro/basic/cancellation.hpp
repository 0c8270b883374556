// ouro/basic/cancellation.hpp - Cooperative cancellation between pipeline stages
#pragma once

#include <atomic>
#include <memory>

namespace ouro
{

/**
 * Shared cancellation flag.
 *
 * Copies observe the same flag. Stages poll `is_cancelled()` at their
 * boundaries; nothing is interrupted mid-stage. A default-constructed
 * token is never cancelled unless `cancel()` is called on it or a copy.
 */
class CancellationToken
{
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

  [[nodiscard]] bool is_cancelled() const noexcept
  {
    return flag_->load(std::memory_order_acquire);
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace ouro
