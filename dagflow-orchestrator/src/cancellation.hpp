#ifndef DAGFLOW_CANCELLATION_HPP
#define DAGFLOW_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace dagflow {

/**
 * @brief Cooperative cancellation signal shared between a caller and an execution
 *
 * Copies share the same flag. A default-constructed token is never cancelled.
 * The orchestrator checks the token at every group boundary; handlers may poll it.
 *
 * Usage Example:
 *   @code
 *   CancellationToken token = CancellationToken::create();
 *   std::thread watchdog([token]() mutable { ...; token.cancel(); });
 *   orchestrator.execute_workflow("wf-1", input, "scheduler", token);
 *   @endcode
 */
class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken create() {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void cancel() {
        if (flag_) {
            flag_->store(true);
        }
    }

    bool is_cancelled() const {
        return flag_ && flag_->load();
    }

    bool can_be_cancelled() const { return static_cast<bool>(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace dagflow

#endif // DAGFLOW_CANCELLATION_HPP
