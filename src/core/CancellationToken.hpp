#pragma once

#include <atomic>
#include <memory>

namespace mcp_orch {

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag. The host creates one per server and hands it
 * to every request; HTTP clients poll it during transfers.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace mcp_orch
