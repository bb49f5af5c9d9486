#pragma once
#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <thread>
#include <type_traits>
#include <vector>

namespace histo::task {

// Concurrency used when a config asks for 0 jobs.
inline std::size_t default_jobs() {
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

/**
 * Apply `fn` to every item on up to `jobs` concurrent tasks and return the
 * results in item order.
 *
 * All-or-nothing: if any call throws, the batch rethrows the error of the
 * lowest-numbered failing task once every task has returned. A failing task
 * stops its own remaining items; sibling tasks are not cancelled.
 */
template <typename T, typename Fn>
auto map_all(const std::vector<T> &items, std::size_t jobs, Fn fn)
    -> std::vector<std::invoke_result_t<Fn &, const T &>> {
  using R = std::invoke_result_t<Fn &, const T &>;
  std::vector<R> out;
  if (items.empty()) {
    return out;
  }
  if (jobs == 0) {
    jobs = default_jobs();
  }
  const std::size_t ntasks = std::min(jobs, items.size());
  const std::size_t chunk = (items.size() + ntasks - 1) / ntasks;

  std::vector<std::future<std::vector<R>>> futs;
  futs.reserve(ntasks);
  for (std::size_t begin = 0; begin < items.size(); begin += chunk) {
    const std::size_t end = std::min(begin + chunk, items.size());
    futs.push_back(std::async(std::launch::async, [&items, &fn, begin, end] {
      std::vector<R> part;
      part.reserve(end - begin);
      for (std::size_t i = begin; i < end; ++i) {
        part.push_back(std::invoke(fn, items[i]));
      }
      return part;
    }));
  }

  out.reserve(items.size());
  std::exception_ptr first;
  for (auto &f : futs) {
    try {
      auto part = f.get();
      if (!first) {
        out.insert(out.end(), std::make_move_iterator(part.begin()),
                   std::make_move_iterator(part.end()));
      }
    } catch (...) {
      if (!first) {
        first = std::current_exception();
      }
    }
  }
  if (first) {
    std::rethrow_exception(first);
  }
  return out;
}

} // namespace histo::task
