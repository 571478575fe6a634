#ifndef VC_PARALLEL_H
#define VC_PARALLEL_H

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace vc {

// Runs fn(i) for every i in [0, count) on up to `workers` threads. Indices are
// handed out in order. The first exception thrown by fn is rethrown on the
// calling thread after all workers have joined; remaining indices are skipped.
template <typename Fn>
void parallel_for(size_t count, int workers, Fn&& fn) {
    if (workers <= 1 || count <= 1) {
        for (size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr error;
    std::mutex error_mutex;

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&]() {
            for (size_t i = next++; i < count && !failed; i = next++) {
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!error) error = std::current_exception();
                    failed = true;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    if (error) std::rethrow_exception(error);
}

} // namespace vc

#endif // VC_PARALLEL_H
