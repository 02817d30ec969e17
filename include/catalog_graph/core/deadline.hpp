#pragma once

#include <catalog_graph/core/result.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// CancellationToken: shared flag. Copies observe the same flag, so a token
// handed to a running operation can be cancelled from another thread.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() noexcept { flag_->store(true, std::memory_order_release); }
    [[nodiscard]] bool IsCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// ---------------------------------------------------------------------------
// Deadline: optional expiry time plus optional cancellation token.
// A default-constructed Deadline never expires.
// ---------------------------------------------------------------------------
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;

    static Deadline After(std::chrono::milliseconds budget);
    static Deadline At(Clock::time_point when);

    [[nodiscard]] Deadline WithToken(CancellationToken token) const;

    [[nodiscard]] bool IsExpired() const;
    [[nodiscard]] bool IsCancelled() const;

    /// Ok while time remains and nobody cancelled; otherwise a Cancelled
    /// error naming the operation that observed it.
    [[nodiscard]] Result<void, Error> Check(const std::string& operation,
                                            const std::string& subject) const;

private:
    std::optional<Clock::time_point> expires_at_;
    std::optional<CancellationToken> token_;
};

} // namespace catalog_graph
