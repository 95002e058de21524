#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/feature_schema.hpp"

namespace bridgewatch::scoring {

using Matrix = std::vector<std::vector<double>>;

/*
  Replaces missing (absent or non-finite) values with the per-feature
  median observed at fit time. A feature never observed gets median 0.
*/
class MedianImputer {
 public:
  static MedianImputer Fit(const std::vector<bridgewatch::model::FeatureRow>& rows, std::size_t width);

  // imputed, when given, is incremented once per filled cell
  std::vector<double> Transform(const bridgewatch::model::FeatureRow& row, std::size_t* imputed = nullptr) const;

  const std::vector<double>& Medians() const { return medians_; }

 private:
  explicit MedianImputer(std::vector<double> medians) : medians_(std::move(medians)) {}

  std::vector<double> medians_;
};

/*
  Per-feature standardization with population standard deviation.
  A zero deviation scales by 1.
*/
class StandardScaler {
 public:
  static StandardScaler Fit(const Matrix& rows, std::size_t width);

  void Transform(std::vector<double>& row) const;

  const std::vector<double>& Means() const { return means_; }
  const std::vector<double>& Scales() const { return scales_; }

 private:
  StandardScaler(std::vector<double> means, std::vector<double> scales) : means_(std::move(means)), scales_(std::move(scales)) {}

  std::vector<double> means_;
  std::vector<double> scales_;
};

} // namespace bridgewatch::scoring
