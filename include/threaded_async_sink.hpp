//
//  threaded_async_sink.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "byte_sink.hpp"

namespace aviforge {

/// @ingroup api
/// Runs the operations of a synchronous sink on one worker thread and hands out futures.
/// Operations execute in FIFO order, so futures resolve in issue order. The wrapped sink must
/// outlive this adapter; pending operations are drained on destruction.
class ThreadedAsyncSink : public AsyncByteSink {
   public:
    explicit ThreadedAsyncSink(ByteSink &inner);
    ~ThreadedAsyncSink() override;

    ThreadedAsyncSink(const ThreadedAsyncSink &) = delete;
    ThreadedAsyncSink &operator=(const ThreadedAsyncSink &) = delete;

    std::future<bool> write(ByteSpan data) override;
    std::future<bool> write_vectored(std::vector<ByteSpan> buffers) override;
    std::future<bool> seek(uint64_t offset) override;

    std::string last_error() const override;

   private:
    std::future<bool> submit(std::function<bool()> op);
    void run();

    ByteSink &inner_;
    mutable std::mutex sink_mutex_;  // serializes inner_ access with last_error()

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<std::packaged_task<bool()>> queue_;
    bool quit_ = false;

    // must be last so the worker is joined before the members it uses are destructed
    std::thread worker_;
};

}  // namespace aviforge
