#pragma once

/// @file src/core/parallel.hpp
/// @brief Chunked fork/join over an index range (internal).

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace rebal::core {

/// Call `fn(i)` for every i in [0, n), split into contiguous chunks over at
/// most `threads` workers. `threads <= 1` runs inline on the caller. The first
/// exception raised by any worker is rethrown after all workers joined.
template <typename Fn>
void parallel_for(std::size_t n, std::size_t threads, Fn&& fn) {
    const std::size_t workers = std::min(threads, n);
    if (workers <= 1) {
        for (std::size_t i = 0; i < n; ++i) fn(i);
        return;
    }

    const std::size_t chunk = (n + workers - 1) / workers;
    std::vector<std::exception_ptr> errors(workers);
    {
        std::vector<std::thread> pool;
        pool.reserve(workers);

        // Joins whatever started, also when spawning a later worker throws.
        struct JoinAll {
            std::vector<std::thread>& threads;
            ~JoinAll() {
                for (auto& t : threads) {
                    if (t.joinable()) t.join();
                }
            }
        } join_all{pool};

        for (std::size_t w = 0; w < workers; ++w) {
            const std::size_t begin = w * chunk;
            const std::size_t end   = std::min(n, begin + chunk);
            pool.emplace_back([&fn, &errors, w, begin, end] {
                try {
                    for (std::size_t i = begin; i < end; ++i) fn(i);
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
    }

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

}  // namespace rebal::core
