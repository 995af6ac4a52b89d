#include <murmur/core/work_coordinator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace murmur::core {

WorkCoordinator::~WorkCoordinator() {
    stop();
    join();
}

void WorkCoordinator::start(std::optional<std::size_t> numThreads) {
    if (!workers_.empty()) {
        throw std::runtime_error("WorkCoordinator already started");
    }

    if (io_.stopped()) {
        io_.restart();
    }
    keepAlive_.emplace(io_.get_executor());

    const std::size_t count =
        std::max<std::size_t>(1, numThreads.value_or(std::thread::hardware_concurrency()));
    workers_.reserve(count);
    try {
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back(&WorkCoordinator::runWorker, this, i);
        }
    } catch (const std::system_error& e) {
        spdlog::error("[WorkCoordinator] Thread {} failed to start: {}", workers_.size(),
                      e.what());
        keepAlive_.reset();
        io_.stop();
        join();
        throw std::runtime_error(std::string("WorkCoordinator start failed: ") + e.what());
    }
    spdlog::info("[WorkCoordinator] {} workers running", count);
}

void WorkCoordinator::runWorker(std::size_t index) {
    spdlog::trace("[WorkCoordinator] Worker {} up", index);
    io_.run();
    spdlog::trace("[WorkCoordinator] Worker {} down", index);
}

void WorkCoordinator::stop() {
    if (keepAlive_) {
        keepAlive_.reset();
        spdlog::debug("[WorkCoordinator] Draining");
    }
}

void WorkCoordinator::join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (!workers_.empty()) {
        spdlog::debug("[WorkCoordinator] {} workers joined", workers_.size());
    }
    workers_.clear();
}

} // namespace murmur::core
