#include <catalog_graph/core/deadline.hpp>

namespace catalog_graph {

Deadline Deadline::After(std::chrono::milliseconds budget) {
    return At(Clock::now() + budget);
}

Deadline Deadline::At(Clock::time_point when) {
    Deadline d;
    d.expires_at_ = when;
    return d;
}

Deadline Deadline::WithToken(CancellationToken token) const {
    Deadline d = *this;
    d.token_ = std::move(token);
    return d;
}

bool Deadline::IsExpired() const {
    return expires_at_.has_value() && Clock::now() >= *expires_at_;
}

bool Deadline::IsCancelled() const {
    return token_.has_value() && token_->IsCancelled();
}

Result<void, Error> Deadline::Check(const std::string& operation,
                                    const std::string& subject) const {
    if (IsCancelled()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Cancelled, operation, subject,
            "Operation was cancelled"));
    }
    if (IsExpired()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Cancelled, operation, subject,
            "Deadline expired"));
    }
    return Result<void, Error>::Ok();
}

} // namespace catalog_graph
