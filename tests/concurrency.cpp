#include "histo/graph_store.hpp"
#include "histo/task.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using histo::DirectedGraph;
using histo::Edge;
using histo::VertexId;

static DirectedGraph chain(std::uint64_t first, std::uint64_t n) {
  DirectedGraph g;
  for (std::uint64_t i = first; i < first + n; ++i) {
    g.add_edge(Edge{.from = {i}, .to = {i + 1}});
  }
  return g;
}

int main() {
  // Results keep item order regardless of batching
  std::vector<int> items(100);
  for (int i = 0; i < 100; ++i) {
    items[i] = i;
  }
  for (std::size_t jobs : {0U, 1U, 3U, 64U, 1000U}) {
    const auto out = histo::task::map_all(items, jobs, [](const int &x) { return x * 2; });
    if (out.size() != items.size()) {
      std::cerr << "map_all lost results\n";
      return 1;
    }
    for (int i = 0; i < 100; ++i) {
      if (out[i] != i * 2) {
        std::cerr << "map_all reordered results\n";
        return 1;
      }
    }
  }
  if (!histo::task::map_all(std::vector<int>{}, 4, [](const int &x) { return x; }).empty()) {
    std::cerr << "map_all of nothing returned something\n";
    return 1;
  }

  // First failing task wins; siblings still run to completion
  std::atomic<int> finished{0};
  try {
    (void)histo::task::map_all(items, 4, [&finished](const int &x) {
      if (x == 30 || x == 80) {
        throw std::runtime_error("fail " + std::to_string(x));
      }
      std::this_thread::sleep_for(std::chrono::microseconds(50));
      finished.fetch_add(1);
      return x;
    });
    std::cerr << "map_all swallowed an error\n";
    return 1;
  } catch (const std::runtime_error &e) {
    if (std::string(e.what()) != "fail 30") {
      std::cerr << "map_all reported the wrong error: " << e.what() << "\n";
      return 1;
    }
  }
  // chunks of 25: [0,25) all run, [25,50) stops at 30, [50,75) all, [75,100) stops at 80
  if (finished.load() != 25 + 5 + 25 + 5) {
    std::cerr << "unexpected sibling progress: " << finished.load() << "\n";
    return 1;
  }

  // Concurrent saves under one name: every object write is compatible,
  // the pointer ends up at one of the graphs
  const fs::path base =
      fs::temp_directory_path() / ("histo_concurrency_" + std::to_string(std::random_device{}()));
  try {
    std::vector<DirectedGraph> graphs;
    for (std::uint64_t k = 0; k < 4; ++k) {
      graphs.push_back(chain(k * 10, 50)); // overlapping vertex ranges
    }
    std::vector<std::thread> writers;
    std::atomic<int> failures{0};
    for (const auto &g : graphs) {
      writers.emplace_back([&base, &g, &failures] {
        try {
          histo::save_graph_as(base, "shared", g);
          histo::save_graph_as(base, "shared", g);
        } catch (const std::exception &e) {
          std::cerr << "writer: " << e.what() << "\n";
          failures.fetch_add(1);
        }
      });
    }
    for (auto &t : writers) {
      t.join();
    }
    if (failures.load() != 0) {
      std::cerr << "concurrent saves failed\n";
      return 1;
    }

    const DirectedGraph back = histo::load_graph(base, "shared");
    bool matches_one = false;
    for (const auto &g : graphs) {
      matches_one = matches_one || back == g;
    }
    if (!matches_one) {
      std::cerr << "shared snapshot is a mix of writers\n";
      return 1;
    }
    if (histo::list_snapshots(base) != std::vector<std::string>{"shared"}) {
      std::cerr << "temporary files left under graph/\n";
      return 1;
    }
    for (const auto &entry : fs::recursive_directory_iterator(base)) {
      if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
        std::cerr << "temporary file left: " << entry.path() << "\n";
        return 1;
      }
    }

    std::cout << "concurrency test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
