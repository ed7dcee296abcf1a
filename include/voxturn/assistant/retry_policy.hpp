#pragma once

#include <exception>
#include <functional>

#include <voxturn/core/context.hpp>
#include <voxturn/core/messages.hpp>

namespace voxturn {

enum class FailureClass { Retryable, Fatal };

using FailureClassifier = std::function<FailureClass(const std::exception&)>;

// Only a transport UNAVAILABLE status is worth another attempt.
FailureClass classifyTransportFailure(const std::exception& e);

/**
 * Runs a turn up to max_attempts times, immediately, as long as the failure
 * is classified Retryable. Fatal failures propagate untouched; running out of
 * attempts raises ExhaustedRetries.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(int max_attempts = 3,
                         FailureClassifier classifier = classifyTransportFailure,
                         Context* ctx = nullptr);

    TurnOutcome execute(const std::function<TurnOutcome()>& turn) const;

    int maxAttempts() const { return max_attempts_; }

private:
    int max_attempts_;
    FailureClassifier classifier_;
    Context* ctx_;
};

} // namespace voxturn
