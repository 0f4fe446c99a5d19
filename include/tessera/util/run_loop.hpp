#ifndef TESSERA_UTIL_RUN_LOOP
#define TESSERA_UTIL_RUN_LOOP

#include <tessera/util/noncopyable.hpp>

#include <functional>
#include <mutex>
#include <queue>

typedef struct uv_loop_s uv_loop_t;
typedef struct uv_async_s uv_async_t;

namespace tessera {
namespace util {

// Single-threaded event loop on which tile loads complete. Loaders hand
// their results back with invoke(); tiles are only ever mutated from the
// thread that calls run().
class RunLoop : private util::noncopyable {
public:
    RunLoop();
    ~RunLoop();

    // Queues `fn` for the next loop iteration. May be called from any thread.
    void invoke(std::function<void()> fn);

    // Blocks until stop() is called, processing queued tasks.
    void run();

    // Processes whatever is queued right now and returns.
    void runOnce();

    void stop();

    std::size_t pending() const;

    uv_loop_t* get() { return loop; }

private:
    void process();

    uv_loop_t* loop;
    uv_async_t* async;

    mutable std::mutex mutex;
    std::queue<std::function<void()>> queue;
};

}
}

#endif
