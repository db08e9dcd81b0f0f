#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace papertrade {
namespace engine {

// Fixed worker pool over one io_context. Long-running tasks are strand-bound
// steady_timer loops posted onto it.
class TaskRuntime {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    explicit TaskRuntime(int worker_threads);
    ~TaskRuntime();

    TaskRuntime(const TaskRuntime&) = delete;
    TaskRuntime& operator=(const TaskRuntime&) = delete;

    void start();
    // Abandons queued handlers and joins the workers. Cancel timers first.
    void stop();

    // Runs ready handlers on the calling thread. Used when the pool is not started.
    std::size_t poll();

    bool isRunning() const { return running_; }

    boost::asio::io_context& context() { return io_; }
    Strand makeStrand() { return boost::asio::make_strand(io_); }

private:
    void workerLoop(int index);

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> workers_;
    int worker_threads_;
    std::atomic<bool> running_{false};
};

} // namespace engine
} // namespace papertrade
