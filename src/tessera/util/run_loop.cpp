#include <tessera/util/run_loop.hpp>
#include <tessera/util/exception.hpp>
#include <tessera/platform/log.hpp>

#include <uv.h>

using namespace tessera::util;

RunLoop::RunLoop()
    : loop(new uv_loop_t),
      async(new uv_async_t) {
    const int err = uv_loop_init(loop);
    if (err != 0) {
        delete loop;
        delete async;
        throw Exception(std::string("failed to initialize run loop: ") + uv_strerror(err));
    }

    async->data = this;
    const int asyncErr = uv_async_init(loop, async, [](uv_async_t* handle) {
        reinterpret_cast<RunLoop*>(handle->data)->process();
    });
    if (asyncErr != 0) {
        uv_loop_close(loop);
        delete loop;
        delete async;
        throw Exception(std::string("failed to initialize run loop: ") + uv_strerror(asyncErr));
    }

    // The wake-up handle alone must not keep the loop alive; run() takes a
    // reference for as long as it wants to block.
    uv_unref(reinterpret_cast<uv_handle_t*>(async));
}

RunLoop::~RunLoop() {
    uv_close(reinterpret_cast<uv_handle_t*>(async), [](uv_handle_t* handle) {
        delete reinterpret_cast<uv_async_t*>(handle);
    });

    // Lets libuv invoke the close callback above.
    uv_run(loop, UV_RUN_DEFAULT);

    const int err = uv_loop_close(loop);
    if (err != 0) {
        tessera::Log::Error(tessera::Event::RunLoop, "failed to close run loop: %s", uv_strerror(err));
    }
    delete loop;
}

void RunLoop::invoke(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push(std::move(fn));
    }
    uv_async_send(async);
}

void RunLoop::run() {
    uv_ref(reinterpret_cast<uv_handle_t*>(async));
    uv_run(loop, UV_RUN_DEFAULT);
}

void RunLoop::runOnce() {
    uv_ref(reinterpret_cast<uv_handle_t*>(async));
    uv_run(loop, UV_RUN_NOWAIT);
    uv_unref(reinterpret_cast<uv_handle_t*>(async));

    // Tasks queued by the tasks that just ran are picked up on the next call.
}

void RunLoop::stop() {
    invoke([this] {
        uv_unref(reinterpret_cast<uv_handle_t*>(async));
    });
}

std::size_t RunLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

void RunLoop::process() {
    std::queue<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::swap(tasks, queue);
    }

    while (!tasks.empty()) {
        tasks.front()();
        tasks.pop();
    }
}
