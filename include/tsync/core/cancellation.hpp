#pragma once

#include <atomic>
#include <memory>

namespace tsync {

/**
 * @brief Shared cancel flag handed from an owner to the work it spawned
 *
 * Copies observe the same flag. Work checks it between units (files,
 * chunks, poll intervals) and never mid-write.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }

    [[nodiscard]] bool is_cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace tsync
