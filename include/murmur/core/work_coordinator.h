#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace murmur::core {

/**
 * Thread pool over one io_context.
 *
 * Handlers posted to the same strand run one at a time in posting order;
 * different strands share the pool. The engine gives each owner a strand so
 * that owner's syncs queue behind each other while other owners proceed.
 */
class WorkCoordinator {
public:
    using Executor = boost::asio::io_context::executor_type;
    using Strand = boost::asio::strand<Executor>;

    WorkCoordinator() = default;
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;

    /**
     * Spawn `numThreads` workers (hardware concurrency when unset, at least
     * one). Throws std::runtime_error when already started or a thread cannot
     * be created.
     */
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    /// Release the keep-alive; workers exit once queued handlers have run.
    void stop();

    /// Block until every worker has exited.
    void join();

    [[nodiscard]] Strand makeStrand() { return boost::asio::make_strand(io_.get_executor()); }

    template <typename Fn> void post(Fn&& fn) {
        boost::asio::post(io_.get_executor(), std::forward<Fn>(fn));
    }

    [[nodiscard]] bool isRunning() const noexcept { return !workers_.empty(); }
    [[nodiscard]] std::size_t getWorkerCount() const noexcept { return workers_.size(); }

private:
    void runWorker(std::size_t index);

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<Executor>> keepAlive_;
    std::vector<std::thread> workers_;
};

} // namespace murmur::core
