#include "app/request_server.hpp"

#include <istream>
#include <ostream>
#include <thread>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/request_codec.hpp"

namespace venvbox::app {

RequestServer::RequestServer(session::ExecutionOrchestrator& orchestrator,
                             const std::uint32_t workers, std::ostream& out)
    : orchestrator_(orchestrator),
      workers_(workers == 0 ? 1 : workers),
      max_pending_(static_cast<std::size_t>(workers_) * 4),
      out_(out) {}

std::size_t RequestServer::serve(std::istream& in) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_ = false;
    }

    std::vector<std::thread> threads;
    threads.reserve(workers_);
    for (std::uint32_t i = 0; i < workers_; ++i) {
        threads.emplace_back(&RequestServer::worker_loop, this);
    }
    LOG_INFO("RequestServer: serving with " + std::to_string(workers_) + " workers");

    std::size_t accepted = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_not_full_.wait(lock, [this] { return pending_.size() < max_pending_; });
        pending_.push_back(std::move(line));
        ++accepted;
        lock.unlock();
        queue_not_empty_.notify_one();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_ = true;
    }
    queue_not_empty_.notify_all();
    for (auto& thread : threads) {
        thread.join();
    }
    LOG_INFO("RequestServer: input closed after " + std::to_string(accepted) + " requests");
    return accepted;
}

void RequestServer::worker_loop() {
    while (true) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_not_empty_.wait(lock, [this] { return closed_ || !pending_.empty(); });
            if (pending_.empty()) {
                return;
            }
            line = std::move(pending_.front());
            pending_.pop_front();
        }
        queue_not_full_.notify_one();
        handle_line(line);
    }
}

void RequestServer::handle_line(const std::string& line) {
    auto decoded = protocol::decode_request(line);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        LOG_WARN("RequestServer: rejected request [" + err.code + "]: " + err.message);
        write_line(protocol::encode_result(protocol::ExecutionResult{"", err.message}));
        return;
    }

    const auto& request = core::errors::get_value(decoded);
    const auto result = orchestrator_.execute(request.request);
    write_line(protocol::encode_result(result, request.correlation_id));
}

void RequestServer::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line << "\n";
    out_.flush();
}

}  // namespace venvbox::app
