#pragma once

#include "http_client.hpp"
#include "progress.hpp"
#include "transfer_config.hpp"
#include "transfer_spec.hpp"
#include "transfer_state.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace rangexfer {

class TransferSession;
using TransferHandle = std::shared_ptr<TransferSession>;

class TransferCoordinator {
public:
    explicit TransferCoordinator(std::shared_ptr<HttpClient> client, TransferConfig config = {});
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Probes, plans and launches the workers, then returns without waiting for them.
    // Throws TransferError(EndpointUnreachable) when probing exhausts its retries and
    // TransferError(OutputWriteFailure / SourceReadFailure) when the local file is unusable.
    [[nodiscard]] TransferHandle start(TransferSpec spec, ProgressSink sink = {});

    // Returns once every worker is quiescent and progress is flushed.
    void pause(const TransferHandle& handle);
    void resume(const TransferHandle& handle);
    // Stops the workers. Partial output and the progress record stay on disk.
    void cancel(const TransferHandle& handle);

    // Blocks until the transfer is paused or reaches a terminal status.
    TransferResult wait(const TransferHandle& handle);
    [[nodiscard]] std::optional<TransferResult> waitFor(const TransferHandle& handle,
                                                        std::chrono::milliseconds timeout);

    [[nodiscard]] TransferState snapshot(const TransferHandle& handle) const;

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<HttpClient> client_;
    TransferConfig config_;
};

} // namespace rangexfer
