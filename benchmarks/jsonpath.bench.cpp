#include "libjsonquery/lex.hpp"
#include "libjsonquery/parse.hpp"
#include "benchmark/benchmark.h"

namespace {

constexpr auto BASE_PATH{"$.store.book[*].price"};
constexpr auto FILTER_PATH{
    "$..book[?@.price > 10 && (length(@.title) < 20 || !@.isbn)]"};

void BM_TokenizeBasePath(benchmark::State& state) {
  for (auto _ : state) {
    libjsonquery::Lexer lexer{BASE_PATH};
    lexer.run();
    benchmark::DoNotOptimize(lexer.tokens().size());
  }
}

void BM_TokenizeFilter(benchmark::State& state) {
  for (auto _ : state) {
    libjsonquery::Lexer lexer{FILTER_PATH};
    lexer.run();
    benchmark::DoNotOptimize(lexer.tokens().size());
  }
}

void BM_ParseBasePath(benchmark::State& state) {
  const libjsonquery::Parser parser{};
  for (auto _ : state) {
    benchmark::DoNotOptimize(parser.parse(BASE_PATH));
  }
}

void BM_ParseFilter(benchmark::State& state) {
  const libjsonquery::Parser parser{};
  for (auto _ : state) {
    benchmark::DoNotOptimize(parser.parse(FILTER_PATH));
  }
}

} // namespace

BENCHMARK(BM_TokenizeBasePath);
BENCHMARK(BM_TokenizeFilter);
BENCHMARK(BM_ParseBasePath);
BENCHMARK(BM_ParseFilter);

BENCHMARK_MAIN();
