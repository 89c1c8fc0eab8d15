#pragma once

#include <algorithm>
#include <exception>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace tagver {

/**
 * @brief The outcome of applying a function to one item in `parallel_map`: either a value, or the
 * exception that escaped the function.
 */
template <typename T>
struct parallel_result {
    std::optional<T>   value;
    std::exception_ptr error;

    bool okay() const noexcept { return error == nullptr; }
};

/**
 * @brief Apply `fn` to every element of `rng` using up to `n_jobs` threads.
 *
 * Results are returned in the order of the input range. An exception thrown for one item is
 * captured into that item's result and does not stop the processing of other items.
 *
 * If `n_jobs` is less than one, uses the hardware concurrency plus two.
 */
template <typename Range, typename Func>
auto parallel_map(Range&& rng, int n_jobs, Func&& fn) {
    using item_type   = decltype(*std::begin(rng));
    using result_type = std::remove_cvref_t<std::invoke_result_t<Func&, item_type>>;

    // We don't bother with a nice thread pool, as the subprocess overhead of each
    // task dwarfs the cost of interlocking.
    std::mutex mut;

    auto       iter  = std::begin(rng);
    const auto stop  = std::end(rng);
    std::size_t index = 0;

    std::vector<parallel_result<result_type>> results(
        static_cast<std::size_t>(std::distance(std::begin(rng), stop)));

    auto run_one = [&]() mutable {
        while (true) {
            std::unique_lock lk{mut};
            if (iter == stop) {
                break;
            }
            auto&& item   = *iter;
            auto   my_idx = index;
            ++iter;
            ++index;
            lk.unlock();
            try {
                auto value = fn(item);
                lk.lock();
                results[my_idx].value.emplace(std::move(value));
            } catch (...) {
                lk.lock();
                results[my_idx].error = std::current_exception();
            }
        }
    };

    if (n_jobs < 1) {
        n_jobs = static_cast<int>(std::thread::hardware_concurrency()) + 2;
    }
    n_jobs = std::min(n_jobs, static_cast<int>(std::max<std::size_t>(results.size(), 1)));

    std::unique_lock         lk{mut};
    std::vector<std::thread> threads;
    std::generate_n(std::back_inserter(threads), n_jobs, [&] { return std::thread(run_one); });
    lk.unlock();
    for (auto& t : threads) {
        t.join();
    }
    return results;
}

}  // namespace tagver
