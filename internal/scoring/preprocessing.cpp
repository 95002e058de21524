#include "preprocessing.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace bridgewatch::scoring {
namespace {

bool Observed(const bridgewatch::model::FeatureValue& value) {
  return value.has_value() && std::isfinite(*value);
}

double Median(std::vector<double>& values) {
  if (values.empty()) return 0.0;

  const std::size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  const double upper = values[mid];
  if (values.size() % 2 == 1) return upper;

  const double lower = *std::max_element(values.begin(), values.begin() + mid);
  return (lower + upper) / 2.0;
}

void CheckWidth(std::size_t actual, std::size_t expected) {
  if (actual != expected) {
    throw std::invalid_argument("feature row has " + std::to_string(actual) + " values, model expects " + std::to_string(expected));
  }
}

} // namespace

MedianImputer MedianImputer::Fit(const std::vector<bridgewatch::model::FeatureRow>& rows, std::size_t width) {
  std::vector<double> medians(width, 0.0);
  std::vector<double> column;
  column.reserve(rows.size());

  for (std::size_t f = 0; f < width; ++f) {
    column.clear();
    for (const auto& row : rows) {
      CheckWidth(row.size(), width);
      if (Observed(row[f])) column.push_back(*row[f]);
    }
    medians[f] = Median(column);
  }
  return MedianImputer(std::move(medians));
}

std::vector<double> MedianImputer::Transform(const bridgewatch::model::FeatureRow& row, std::size_t* imputed) const {
  CheckWidth(row.size(), medians_.size());

  std::vector<double> out(row.size());
  for (std::size_t f = 0; f < row.size(); ++f) {
    if (Observed(row[f])) {
      out[f] = *row[f];
    } else {
      out[f] = medians_[f];
      if (imputed) ++*imputed;
    }
  }
  return out;
}

StandardScaler StandardScaler::Fit(const Matrix& rows, std::size_t width) {
  std::vector<double> means(width, 0.0);
  std::vector<double> scales(width, 1.0);
  if (rows.empty()) return StandardScaler(std::move(means), std::move(scales));

  const double n = static_cast<double>(rows.size());
  for (const auto& row : rows) {
    CheckWidth(row.size(), width);
    for (std::size_t f = 0; f < width; ++f) means[f] += row[f];
  }
  for (auto& m : means) m /= n;

  std::vector<double> variance(width, 0.0);
  for (const auto& row : rows) {
    for (std::size_t f = 0; f < width; ++f) {
      const double d = row[f] - means[f];
      variance[f] += d * d;
    }
  }
  for (std::size_t f = 0; f < width; ++f) {
    const double stddev = std::sqrt(variance[f] / n);
    scales[f]           = stddev > 0.0 ? stddev : 1.0;
  }
  return StandardScaler(std::move(means), std::move(scales));
}

void StandardScaler::Transform(std::vector<double>& row) const {
  CheckWidth(row.size(), means_.size());
  for (std::size_t f = 0; f < row.size(); ++f) {
    row[f] = (row[f] - means_[f]) / scales_[f];
  }
}

} // namespace bridgewatch::scoring
