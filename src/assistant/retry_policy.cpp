#include <voxturn/assistant/retry_policy.hpp>

#include <string>

#include <voxturn/core/errors.hpp>

namespace voxturn {

FailureClass classifyTransportFailure(const std::exception& e) {
  auto* t = dynamic_cast<const TransportError*>(&e);
  if (t && t->code() == StatusCode::Unavailable) return FailureClass::Retryable;
  return FailureClass::Fatal;
}

RetryPolicy::RetryPolicy(int max_attempts, FailureClassifier classifier, Context* ctx)
: max_attempts_(max_attempts < 1 ? 1 : max_attempts),
  classifier_(classifier ? std::move(classifier) : FailureClassifier(classifyTransportFailure)),
  ctx_(ctx) {}

TurnOutcome RetryPolicy::execute(const std::function<TurnOutcome()>& turn) const {
  std::string last_error;
  for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
    try {
      return turn();
    } catch (const std::exception& e) {
      if (classifier_(e) == FailureClass::Fatal) throw;
      last_error = e.what();
      if (ctx_) {
        ctx_->log().error("Retry", "attempt " + std::to_string(attempt) + "/" +
                          std::to_string(max_attempts_) + " unavailable: " + last_error);
        if (attempt < max_attempts_) ctx_->counters().retries++;
      }
    }
  }
  throw ExhaustedRetries(max_attempts_, last_error);
}

} // namespace voxturn
