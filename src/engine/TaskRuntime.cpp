#include "engine/TaskRuntime.h"

#include <exception>

#include "common/Logger.h"

namespace papertrade {
namespace engine {

TaskRuntime::TaskRuntime(int worker_threads)
    : worker_threads_(worker_threads > 0 ? worker_threads : 1)
{
}

TaskRuntime::~TaskRuntime() {
    stop();
}

void TaskRuntime::start() {
    if (running_.exchange(true)) {
        return;
    }

    if (io_.stopped()) {
        io_.restart();
    }
    work_guard_.emplace(boost::asio::make_work_guard(io_));

    workers_.reserve(static_cast<std::size_t>(worker_threads_));
    for (int i = 0; i < worker_threads_; ++i) {
        workers_.emplace_back(&TaskRuntime::workerLoop, this, i);
    }
    LOG_INFO("Task runtime started: {} workers", worker_threads_);
}

void TaskRuntime::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    work_guard_.reset();
    io_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_INFO("Task runtime stopped");
}

std::size_t TaskRuntime::poll() {
    if (io_.stopped()) {
        io_.restart();
    }
    return io_.poll();
}

void TaskRuntime::workerLoop(int index) {
    for (;;) {
        try {
            io_.run();
            return;
        } catch (const std::exception& e) {
            LOG_ERROR("Worker {} handler failed: {}", index, e.what());
        }
    }
}

} // namespace engine
} // namespace papertrade
