// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio.hpp>

#include <algorithm>
#include <thread>
#include <vector>

enum class thread_pool_status
{
    CREATED,
    RUNNING,
    STOPPED
};

// io_context shared by every connector, run by pool_size threads
class thread_pool_manager {
public:
    explicit thread_pool_manager(size_t pool_size = std::thread::hardware_concurrency())
        : pool_size_{std::max<size_t>(pool_size, 1)}
        , pool_status_{thread_pool_status::CREATED}
        , work_guard_(boost::asio::make_work_guard(ctx_)) {}

    thread_pool_manager(const thread_pool_manager&) = delete;
    thread_pool_manager& operator=(const thread_pool_manager&) = delete;

    boost::asio::io_context& ctx() { return ctx_; }

    thread_pool_status status() const noexcept { return pool_status_; }
    size_t size() const noexcept { return pool_size_; }

    void start() {
        if (pool_status_ != thread_pool_status::CREATED) {
            return;
        }
        thread_pool_.reserve(pool_size_);
        for (size_t i = 0; i < pool_size_; ++i) {
            thread_pool_.emplace_back([this]() { ctx_.run(); });
        }
        pool_status_ = thread_pool_status::RUNNING;
    }

    // lets queued statements finish, then joins
    void stop() {
        if (pool_status_ != thread_pool_status::RUNNING) {
            return;
        }
        work_guard_.reset();
        for (auto& t : thread_pool_) {
            t.join();
        }
        thread_pool_.clear();
        ctx_.stop();
        pool_status_ = thread_pool_status::STOPPED;
    }

    ~thread_pool_manager() { stop(); }

private:
    boost::asio::io_context ctx_;
    size_t pool_size_;
    std::vector<std::jthread> thread_pool_;
    thread_pool_status pool_status_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
};
