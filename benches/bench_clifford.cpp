#include <benchmark/benchmark.h>

#include <Eigen/Dense>
#include <cstdlib>
#include <random>
#include <vector>

#include <clifford/clifford.hpp>

using clifford::Element;

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() {
    setenv("CLIFFORD_TRACE", "0", 1);
  }
} kBenchEnvSetup;

Eigen::MatrixXd gaussian_matrix(int rows, int cols, unsigned seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<double> dist(0.0, 1.0);
  Eigen::MatrixXd m(rows, cols);
  for (int j = 0; j < cols; ++j) {
    for (int i = 0; i < rows; ++i) {
      m(i, j) = dist(gen);
    }
  }
  return m;
}
} // namespace

void bench_blade_construction(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Eigen::MatrixXd vectors = gaussian_matrix(n, n / 2, 7);

  for (auto _ : state) {
    Element<double> b = clifford::blade(vectors);
    benchmark::DoNotOptimize(b);
  }
}

void bench_wedge(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Element<double> a = clifford::blade(gaussian_matrix(n, n / 2, 11));
  const Element<double> b = clifford::blade(gaussian_matrix(n, n / 4, 13));

  for (auto _ : state) {
    Element<double> w = clifford::wedge(a, b);
    benchmark::DoNotOptimize(w);
  }
}

void bench_dual(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Element<double> b = clifford::blade(gaussian_matrix(n, n / 2, 17));

  for (auto _ : state) {
    Element<double> d = clifford::dual(b);
    benchmark::DoNotOptimize(d);
  }
}

void bench_relative_dual(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Element<double> reference = clifford::blade(gaussian_matrix(n, n - 1, 19));
  const Eigen::MatrixXd inside =
      clifford::basis(reference).leftCols(n / 2) * gaussian_matrix(n / 2, n / 2, 23);
  const Element<double> b = clifford::blade(inside);

  for (auto _ : state) {
    Element<double> d = clifford::dual(b, reference);
    benchmark::DoNotOptimize(d);
  }
}

void bench_multivector_reduction(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  std::vector<Element<double>> terms;
  terms.push_back(clifford::scalar(2.0));
  for (unsigned seed = 0; seed < 8; ++seed) {
    terms.push_back(clifford::blade(gaussian_matrix(n, 1, 100 + seed)));
    terms.push_back(clifford::blade(gaussian_matrix(n, 2, 200 + seed)));
  }
  terms.push_back(clifford::pseudoscalar(n, 3.0));

  for (auto _ : state) {
    Element<double> mv = clifford::multivector(terms);
    benchmark::DoNotOptimize(mv);
  }
}

void bench_isapprox_blades(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Eigen::MatrixXd vectors = gaussian_matrix(n, n / 2, 29);
  const Element<double> a = clifford::blade(vectors);
  const Element<double> b = clifford::blade(Eigen::MatrixXd(vectors * 2.0));

  for (auto _ : state) {
    bool same = clifford::isapprox(a, b);
    benchmark::DoNotOptimize(same);
  }
}

BENCHMARK(bench_blade_construction)->Arg(4)->Arg(16)->Arg(64);
BENCHMARK(bench_wedge)->Arg(4)->Arg(16)->Arg(64);
BENCHMARK(bench_dual)->Arg(4)->Arg(16)->Arg(64);
BENCHMARK(bench_relative_dual)->Arg(4)->Arg(16)->Arg(64);
BENCHMARK(bench_multivector_reduction)->Arg(4)->Arg(16);
BENCHMARK(bench_isapprox_blades)->Arg(4)->Arg(16)->Arg(64);

BENCHMARK_MAIN();
