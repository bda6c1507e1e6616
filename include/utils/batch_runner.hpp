#ifndef CHUNKVAULT_UTILS_BATCH_RUNNER_HPP
#define CHUNKVAULT_UTILS_BATCH_RUNNER_HPP

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace chunkvault {
namespace utils {

// Outcome of one task in a batch; exactly one of value or error is set
template <typename T>
struct BatchResult {
  std::size_t index;
  std::optional<T> value;
  std::exception_ptr error;

  bool ok() const { return !error; }
};

// Parallelism of zero or less means sequential
inline std::size_t effective_parallelism(int parallel) {
  return parallel <= 1 ? 1 : static_cast<std::size_t>(parallel);
}

// Starts each batch task on its own std::thread
struct ThreadSpawner {
  template <typename Work>
  void operator()(std::vector<std::thread>& threads, Work&& work) const {
    threads.emplace_back(std::forward<Work>(work));
  }
};

// Runs task(i) for every i in [begin, end) concurrently, one thread per task, and
// returns once all of them have settled. Results are in completion order, not index order.
// Task exceptions are captured in the matching BatchResult. If a thread cannot be
// started, that task and every later one in the batch fail with the spawn error
// while the tasks already started still run to completion.
template <typename T, typename Task, typename Spawner = ThreadSpawner>
std::vector<BatchResult<T>> run_batch(std::size_t begin, std::size_t end, Task task,
                                      Spawner spawn = Spawner()) {
  std::vector<BatchResult<T>> results;
  results.reserve(end > begin ? end - begin : 0);
  std::mutex results_mutex;

  auto run_one = [&](std::size_t index) {
    BatchResult<T> result{index, std::nullopt, nullptr};
    try {
      result.value.emplace(task(index));
    } catch (...) {
      result.error = std::current_exception();
    }
    std::lock_guard<std::mutex> lock(results_mutex);
    results.push_back(std::move(result));
  };

  // A single task runs inline
  if (end - begin == 1) {
    run_one(begin);
    return results;
  }

  std::vector<std::thread> threads;
  threads.reserve(end > begin ? end - begin : 0);
  for (std::size_t i = begin; i < end; ++i) {
    try {
      spawn(threads, [&run_one, i]() { run_one(i); });
    } catch (const std::exception&) {
      const auto error = std::current_exception();
      std::lock_guard<std::mutex> lock(results_mutex);
      for (std::size_t skipped = i; skipped < end; ++skipped) {
        results.push_back(BatchResult<T>{skipped, std::nullopt, error});
      }
      break;
    }
  }

  for (auto& thread : threads) {
    thread.join();
  }
  return results;
}

// Sorts batch results by task index
template <typename T>
void sort_by_index(std::vector<BatchResult<T>>& results) {
  std::sort(results.begin(), results.end(),
            [](const BatchResult<T>& a, const BatchResult<T>& b) { return a.index < b.index; });
}

// Rethrows the failure with the lowest task index, if any
template <typename T>
void rethrow_first_error(const std::vector<BatchResult<T>>& results) {
  const BatchResult<T>* first = nullptr;
  for (const auto& result : results) {
    if (!result.ok() && (!first || result.index < first->index)) {
      first = &result;
    }
  }
  if (first) {
    std::rethrow_exception(first->error);
  }
}

} // namespace utils
} // namespace chunkvault

#endif // CHUNKVAULT_UTILS_BATCH_RUNNER_HPP
