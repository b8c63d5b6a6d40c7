//
//  threaded_async_sink.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "threaded_async_sink.hpp"

#include <utility>

namespace aviforge {

ThreadedAsyncSink::ThreadedAsyncSink(ByteSink &inner)
    : inner_(inner), worker_([this] { run(); }) {}

ThreadedAsyncSink::~ThreadedAsyncSink() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        quit_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::future<bool> ThreadedAsyncSink::submit(std::function<bool()> op) {
    std::packaged_task<bool()> task([this, op = std::move(op)] {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        return op();
    });
    auto result = task.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return result;
}

std::future<bool> ThreadedAsyncSink::write(ByteSpan data) {
    return submit([this, data] { return inner_.write(data); });
}

std::future<bool> ThreadedAsyncSink::write_vectored(std::vector<ByteSpan> buffers) {
    return submit(
        [this, buffers = std::move(buffers)] { return inner_.write_vectored(buffers); });
}

std::future<bool> ThreadedAsyncSink::seek(uint64_t offset) {
    return submit([this, offset] { return inner_.seek(offset); });
}

std::string ThreadedAsyncSink::last_error() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return inner_.last_error();
}

void ThreadedAsyncSink::run() {
    for (;;) {
        std::packaged_task<bool()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return quit_ || !queue_.empty(); });
            if (queue_.empty()) {
                // quit_ with nothing left to drain.
                return;
            }
            task = std::move(queue_.front());
            queue_.pop();
        }
        task();
    }
}

}  // namespace aviforge
