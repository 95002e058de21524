#include "isolation_forest.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace bridgewatch::scoring {
namespace {

constexpr double kEulerGamma = 0.5772156649015329;

// Linear interpolation between closest ranks, q in [0, 1].
double Quantile(std::vector<double> values, double q) {
  std::sort(values.begin(), values.end());
  const double pos   = q * static_cast<double>(values.size() - 1);
  const auto   lower = static_cast<std::size_t>(std::floor(pos));
  const auto   upper = std::min(lower + 1, values.size() - 1);
  const double frac  = pos - static_cast<double>(lower);
  return values[lower] + (values[upper] - values[lower]) * frac;
}

} // namespace

double IsolationForest::AveragePathLength(std::size_t n) {
  if (n <= 1) return 0.0;
  if (n == 2) return 1.0;
  const double m = static_cast<double>(n);
  return 2.0 * (std::log(m - 1.0) + kEulerGamma) - 2.0 * (m - 1.0) / m;
}

IsolationForest IsolationForest::Fit(const Matrix& rows, const Options& options) {
  if (rows.empty()) {
    throw std::invalid_argument("isolation forest needs at least one row");
  }
  if (options.n_estimators == 0) {
    throw std::invalid_argument("isolation forest needs at least one tree");
  }
  if (!(options.contamination > 0.0 && options.contamination <= 0.5)) {
    throw std::invalid_argument("contamination must be in (0, 0.5], got " + std::to_string(options.contamination));
  }

  IsolationForest forest;
  forest.width_     = rows.front().size();
  forest.subsample_ = std::min<std::size_t>(std::max<uint32_t>(options.max_samples, 1), rows.size());

  for (const auto& row : rows) {
    if (row.size() != forest.width_) {
      throw std::invalid_argument("isolation forest rows must all have " + std::to_string(forest.width_) + " features");
    }
  }

  const auto max_depth = static_cast<std::size_t>(std::ceil(std::log2(std::max<double>(static_cast<double>(forest.subsample_), 2.0))));

  std::mt19937_64          rng(options.seed);
  std::vector<std::size_t> all(rows.size());
  std::iota(all.begin(), all.end(), 0);

  forest.trees_.reserve(options.n_estimators);
  for (uint32_t t = 0; t < options.n_estimators; ++t) {
    // partial Fisher-Yates: the first subsample_ slots become the sample
    for (std::size_t i = 0; i < forest.subsample_; ++i) {
      std::uniform_int_distribution<std::size_t> pick(i, all.size() - 1);
      std::swap(all[i], all[pick(rng)]);
    }
    std::vector<std::size_t> index(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(forest.subsample_));

    Tree tree;
    Grow(tree, rows, index, 0, index.size(), 0, max_depth, rng);
    forest.trees_.push_back(std::move(tree));
  }

  std::vector<double> training_scores;
  training_scores.reserve(rows.size());
  for (const auto& row : rows) {
    training_scores.push_back(forest.ScoreSample(row));
  }
  forest.offset_ = Quantile(std::move(training_scores), options.contamination);
  return forest;
}

int IsolationForest::Grow(Tree& tree, const Matrix& rows, std::vector<std::size_t>& index, std::size_t begin, std::size_t end,
                          std::size_t depth, std::size_t max_depth, std::mt19937_64& rng) {
  const int id = static_cast<int>(tree.size());
  tree.push_back(Node{});
  tree[id].size = end - begin;

  if (depth >= max_depth || end - begin <= 1) return id;

  const std::size_t width = rows[index[begin]].size();

  std::vector<std::size_t> candidates;
  std::vector<double>      lows(width), highs(width);
  for (std::size_t f = 0; f < width; ++f) {
    double lo = rows[index[begin]][f];
    double hi = lo;
    for (std::size_t i = begin + 1; i < end; ++i) {
      const double v = rows[index[i]][f];
      lo             = std::min(lo, v);
      hi             = std::max(hi, v);
    }
    lows[f]  = lo;
    highs[f] = hi;
    if (hi > lo) candidates.push_back(f);
  }

  // every remaining row is identical
  if (candidates.empty()) return id;

  std::uniform_int_distribution<std::size_t> pick_feature(0, candidates.size() - 1);
  const std::size_t                          feature = candidates[pick_feature(rng)];

  std::uniform_real_distribution<double> pick_threshold(lows[feature], highs[feature]);
  double                                 threshold = pick_threshold(rng);
  if (threshold >= highs[feature]) threshold = lows[feature];

  auto middle = std::partition(index.begin() + static_cast<std::ptrdiff_t>(begin), index.begin() + static_cast<std::ptrdiff_t>(end),
                               [&](std::size_t r) { return rows[r][feature] <= threshold; });
  const auto split = static_cast<std::size_t>(middle - index.begin());

  const int left  = Grow(tree, rows, index, begin, split, depth + 1, max_depth, rng);
  const int right = Grow(tree, rows, index, split, end, depth + 1, max_depth, rng);

  // tree may have reallocated during the recursive calls
  tree[id].feature   = static_cast<int>(feature);
  tree[id].threshold = threshold;
  tree[id].left      = left;
  tree[id].right     = right;
  return id;
}

double IsolationForest::PathLength(const Tree& tree, const std::vector<double>& x) const {
  int    node  = 0;
  double depth = 0.0;
  while (tree[node].feature >= 0) {
    node = x[static_cast<std::size_t>(tree[node].feature)] <= tree[node].threshold ? tree[node].left : tree[node].right;
    depth += 1.0;
  }
  return depth + AveragePathLength(tree[node].size);
}

double IsolationForest::ScoreSample(const std::vector<double>& x) const {
  if (x.size() != width_) {
    throw std::invalid_argument("isolation forest expects " + std::to_string(width_) + " features, got " + std::to_string(x.size()));
  }

  double total = 0.0;
  for (const auto& tree : trees_) {
    total += PathLength(tree, x);
  }
  const double mean_depth = total / static_cast<double>(trees_.size());

  // a single-row sample isolates nothing
  const double normalizer = AveragePathLength(subsample_);
  if (normalizer <= 0.0) return -0.5;
  return -std::pow(2.0, -mean_depth / normalizer);
}

} // namespace bridgewatch::scoring
