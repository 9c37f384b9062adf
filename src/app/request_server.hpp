#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <string>
#include "session/orchestrator.hpp"

namespace venvbox::app {

// Line-oriented front end: one JSON request per input line, one JSON result
// per output line. Lines are read on the calling thread and handed to a fixed
// pool of workers, so a slow build or a hung snippet never stops intake.
// Results are written in completion order; clients correlate by "id".
class RequestServer {
public:
    RequestServer(session::ExecutionOrchestrator& orchestrator, std::uint32_t workers,
                  std::ostream& out);

    // Blocks until `in` is exhausted and every accepted request has answered.
    // Returns the number of lines handled.
    std::size_t serve(std::istream& in);

private:
    void worker_loop();
    void handle_line(const std::string& line);
    void write_line(const std::string& line);

    session::ExecutionOrchestrator& orchestrator_;
    std::uint32_t workers_;
    std::size_t max_pending_;
    std::ostream& out_;

    std::mutex queue_mutex_;
    std::condition_variable queue_not_empty_;
    std::condition_variable queue_not_full_;
    std::deque<std::string> pending_;
    bool closed_ = false;

    std::mutex out_mutex_;
};

}  // namespace venvbox::app
