#pragma once

#include "ITransport.hpp"
#include "WorkerPool.hpp"
#include "core/Dispatcher.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace toolrpc {

struct SessionOptions {
    // Frames handled at once; 1 handles them inline in read order
    std::size_t workers = 1;
};

/**
 * @brief Connection loop between a transport and the Dispatcher
 *
 * Reads frames until EOF or stop(), hands each one to the Dispatcher and
 * writes the reply back whole. With more than one worker, frames are
 * dispatched concurrently and replies may be written out of order; clients
 * match them by id.
 */
class Session {
public:
    /**
     * @brief Construct session
     * @param transport Transport to serve (must not be null)
     * @param dispatcher Shared dispatcher (must not be null)
     * @param options Concurrency settings
     */
    Session(std::unique_ptr<ITransport> transport,
            std::shared_ptr<const Dispatcher> dispatcher,
            SessionOptions options = {});

    /**
     * @brief Start session main loop
     *
     * Blocks until stop() is called or the transport reaches EOF. On EOF,
     * frames already read are still answered.
     */
    void run();

    /**
     * @brief Signal session to stop gracefully
     *
     * Frames not yet started are abandoned and the transport is closed, so
     * replies of in-flight calls are dropped. This also holds when run() has
     * already seen EOF and is waiting for queued frames.
     */
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief Number of frames read so far
     */
    std::size_t frames_received() const { return frames_received_; }

private:
    void process_frame(const std::string& frame);
    void send(const std::string& reply);

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<const Dispatcher> dispatcher_;
    SessionOptions options_;
    std::mutex write_mutex_;
    std::mutex pool_mutex_;
    std::unique_ptr<WorkerPool> pool_;  // Only while run() uses workers
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> frames_received_{0};
};

} // namespace toolrpc
