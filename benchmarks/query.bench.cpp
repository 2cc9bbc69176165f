#include "libjsonquery/document.hpp"
#include "libjsonquery/query.hpp"
#include "benchmark/benchmark.h"
#include <string> // std::string

namespace {

Json::Value books(int count) {
  Json::Value rv{Json::objectValue};
  rv["books"] = Json::Value{Json::arrayValue};
  for (int i = 0; i < count; ++i) {
    Json::Value book{Json::objectValue};
    book["title"] = "Book " + std::to_string(i);
    book["price"] = (i * 37 % 100) + 0.99;
    rv["books"].append(book);
  }
  return rv;
}

} // namespace

static void BM_QueryPlain(benchmark::State& state) {
  const auto document{books(static_cast<int>(state.range(0)))};
  for (auto _ : state) {
    benchmark::DoNotOptimize(
        libjsonquery::evaluate_query(document, "$.books[*].price"));
  }
}

static void BM_QuerySort(benchmark::State& state) {
  const auto document{books(static_cast<int>(state.range(0)))};
  for (auto _ : state) {
    benchmark::DoNotOptimize(
        libjsonquery::evaluate_query(document, "$.books.sort(-price)"));
  }
}

static void BM_QuerySum(benchmark::State& state) {
  const auto document{books(static_cast<int>(state.range(0)))};
  for (auto _ : state) {
    benchmark::DoNotOptimize(
        libjsonquery::evaluate_query(document, "$.books.sum(price)"));
  }
}

static void BM_Filter(benchmark::State& state) {
  const auto document{books(static_cast<int>(state.range(0)))};
  for (auto _ : state) {
    benchmark::DoNotOptimize(
        libjsonquery::evaluate_filter(document, "$.books", "@.price > 50"));
  }
}

BENCHMARK(BM_QueryPlain)->Range(8, 4096);
BENCHMARK(BM_QuerySort)->Range(8, 4096);
BENCHMARK(BM_QuerySum)->Range(8, 4096);
BENCHMARK(BM_Filter)->Range(8, 4096);

BENCHMARK_MAIN();
