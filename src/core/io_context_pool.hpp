#pragma once
#include "core/logger.h"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

namespace eio::core {

    /**
     * @brief Fixed set of io_contexts, each run by its own thread.
     * Connections are spread over them round-robin.
     */
    class IoContextPool {
    public:
        using Work = asio::executor_work_guard<asio::io_context::executor_type>;
        using WorkPtr = std::unique_ptr<Work>;

        explicit IoContextPool(std::size_t size = 2);
        ~IoContextPool();

        IoContextPool(const IoContextPool &) = delete;
        IoContextPool &operator=(const IoContextPool &) = delete;

        asio::io_context &get_io_context();
        std::size_t size() const { return io_contexts_.size(); }
        void stop();

    private:
        std::vector<std::unique_ptr<asio::io_context>> io_contexts_;
        std::vector<WorkPtr> works_;
        std::vector<std::thread> threads_;
        std::atomic<std::size_t> next_{0};
    };

    inline IoContextPool::IoContextPool(std::size_t size) {
        if (size == 0) {
            size = 1;
        }
        for (std::size_t i = 0; i < size; ++i) {
            io_contexts_.push_back(std::make_unique<asio::io_context>());
            works_.push_back(std::make_unique<Work>(asio::make_work_guard(*io_contexts_.back())));
        }

        for (std::size_t i = 0; i < io_contexts_.size(); ++i) {
            threads_.emplace_back([this, i]() {
                try {
                    io_contexts_[i]->run();
                } catch (const std::exception &e) {
                    EIO_ERROR("io_context {} stopped with error: {}", i, e.what());
                }
            });
        }
    }

    inline IoContextPool::~IoContextPool() {
        stop();
    }

    inline asio::io_context &IoContextPool::get_io_context() {
        return *io_contexts_[next_.fetch_add(1) % io_contexts_.size()];
    }

    inline void IoContextPool::stop() {
        for (auto &work: works_) {
            work.reset();
        }

        for (auto &io: io_contexts_) {
            io->stop();
        }

        for (auto &t: threads_) {
            if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
                try {
                    t.join();
                } catch (const std::system_error &e) {
                    EIO_ERROR("Error joining io thread: {}", e.what());
                }
            }
        }
    }

}// namespace eio::core
