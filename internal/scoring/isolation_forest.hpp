#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "preprocessing.hpp"

namespace bridgewatch::scoring {

/*
  Isolation forest.

  Each tree is grown on min(max_samples, N) rows drawn without replacement,
  down to depth ceil(log2(subsample)). A split picks a random feature among
  those not constant in the node and a uniform threshold in its range; rows
  with value <= threshold go left.

    score_samples(x) = -2^(-E[h(x)] / c(subsample))
    decision(x)      = score_samples(x) - offset

  where h(x) adds c(leaf size) at the leaf and offset is the
  contamination-quantile of the training scores. decision < 0 is an outlier.
*/
class IsolationForest {
 public:
  struct Options {
    uint32_t n_estimators  = 200;
    uint32_t max_samples   = 256;
    double   contamination = 0.05;
    uint64_t seed          = 42;
  };

  // throws std::invalid_argument on an empty matrix or bad options
  static IsolationForest Fit(const Matrix& rows, const Options& options);

  double ScoreSample(const std::vector<double>& x) const;

  double Decision(const std::vector<double>& x) const {
    return ScoreSample(x) - offset_;
  }

  double      Offset() const { return offset_; }
  std::size_t TreeCount() const { return trees_.size(); }
  std::size_t FeatureCount() const { return width_; }
  std::size_t SubsampleSize() const { return subsample_; }

  // c(n): average path length of an unsuccessful BST search over n points
  static double AveragePathLength(std::size_t n);

 private:
  struct Node {
    int         feature   = -1; // -1 marks a leaf
    double      threshold = 0.0;
    int         left      = -1;
    int         right     = -1;
    std::size_t size      = 0;
  };

  using Tree = std::vector<Node>;

  IsolationForest() = default;

  static int Grow(Tree& tree, const Matrix& rows, std::vector<std::size_t>& index, std::size_t begin, std::size_t end, std::size_t depth,
                  std::size_t max_depth, std::mt19937_64& rng);

  double PathLength(const Tree& tree, const std::vector<double>& x) const;

  std::vector<Tree> trees_;
  std::size_t       width_     = 0;
  std::size_t       subsample_ = 0;
  double            offset_    = 0.0;
};

} // namespace bridgewatch::scoring
