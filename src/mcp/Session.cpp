#include "Session.hpp"
#include "core/MessageCodec.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace toolrpc {

Session::Session(std::unique_ptr<ITransport> transport,
                 std::shared_ptr<const Dispatcher> dispatcher,
                 SessionOptions options)
    : transport_(std::move(transport)),
      dispatcher_(std::move(dispatcher)),
      options_(options) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (!dispatcher_) {
        throw std::invalid_argument("Dispatcher cannot be null");
    }
    if (options_.workers == 0) {
        throw std::invalid_argument("Session needs at least one worker");
    }
    spdlog::info("Session initialized with {} worker(s)", options_.workers);
}

void Session::run() {
    running_ = true;
    stop_requested_ = false;
    spdlog::info("Session starting main loop");

    WorkerPool* pool = nullptr;
    if (options_.workers > 1) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        pool_ = std::make_unique<WorkerPool>(options_.workers);
        pool = pool_.get();
    }

    while (!stop_requested_ && transport_->is_open()) {
        std::optional<std::string> frame;
        try {
            frame = transport_->read_message();
        } catch (const std::exception& e) {
            spdlog::error("Error reading from transport: {}", e.what());
            break;
        }

        if (!frame) {
            spdlog::info("Transport reached end of input, stopping session");
            break;
        }
        ++frames_received_;

        if (!pool) {
            process_frame(*frame);
            continue;
        }

        bool queued = pool->submit([this, text = std::move(*frame)]() {
            process_frame(text);
        });
        if (!queued) {
            spdlog::warn("Worker pool is shutting down, frame dropped");
        }
    }

    if (pool) {
        if (stop_requested_) {
            pool->shutdown();
        }
        // A stop() arriving during the wait shuts the pool down, which
        // drops the remaining queue and leaves only in-flight frames
        pool->wait_idle();

        std::unique_ptr<WorkerPool> finished;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            finished = std::move(pool_);
        }
        finished.reset();  // joins workers
    }

    running_ = false;
    spdlog::info("Session stopped");
}

void Session::stop() {
    spdlog::info("Session stop requested");
    stop_requested_ = true;
    transport_->close();

    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (pool_) {
        std::size_t abandoned = pool_->shutdown();
        spdlog::debug("Stop abandoned {} queued frame(s)", abandoned);
    }
}

void Session::process_frame(const std::string& frame) {
    try {
        std::optional<std::string> reply = dispatcher_->handle(frame);
        if (reply) {
            send(*reply);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error processing frame: {}", e.what());
        try {
            send(MessageCodec::encode(Response::failure(std::nullopt,
                error_code::INTERNAL_ERROR, std::string("Internal error: ") + e.what())));
        } catch (const std::exception& write_error) {
            spdlog::error("Failed to send error response: {}", write_error.what());
        }
    }
}

void Session::send(const std::string& reply) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->write_message(reply);
}

} // namespace toolrpc
