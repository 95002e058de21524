#include "internal/scoring/preprocessing.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

using bridgewatch::model::FeatureRow;
using bridgewatch::scoring::Matrix;
using bridgewatch::scoring::MedianImputer;
using bridgewatch::scoring::StandardScaler;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

void TestMedianIgnoresMissingAndNonFinite() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  std::vector<FeatureRow> rows = {
      {1.0, 10.0, std::nullopt},
      {3.0, std::nullopt, std::nullopt},
      {2.0, 30.0, nan},
      {100.0, 20.0, inf},
  };

  auto imputer = MedianImputer::Fit(rows, 3);
  // even count averages the two middle values
  assert(Near(imputer.Medians()[0], 2.5));
  // odd count takes the middle value
  assert(Near(imputer.Medians()[1], 20.0));
  // never observed
  assert(Near(imputer.Medians()[2], 0.0));
}

void TestTransformFillsAndCounts() {
  std::vector<FeatureRow> rows = {{1.0, 4.0}, {3.0, 8.0}, {5.0, std::nullopt}};
  auto                    imputer = MedianImputer::Fit(rows, 2);

  std::size_t imputed = 0;
  auto        filled  = imputer.Transform({std::nullopt, std::numeric_limits<double>::quiet_NaN()}, &imputed);
  assert(imputed == 2);
  assert(Near(filled[0], 3.0));
  assert(Near(filled[1], 6.0));

  auto untouched = imputer.Transform({7.0, -1.0}, &imputed);
  assert(imputed == 2);
  assert(Near(untouched[0], 7.0));
  assert(Near(untouched[1], -1.0));
}

void TestScalerUsesPopulationDeviation() {
  Matrix rows = {{2.0, 5.0}, {4.0, 5.0}, {4.0, 5.0}, {4.0, 5.0}, {5.0, 5.0}, {5.0, 5.0}, {7.0, 5.0}, {9.0, 5.0}};

  auto scaler = StandardScaler::Fit(rows, 2);
  assert(Near(scaler.Means()[0], 5.0));
  assert(Near(scaler.Scales()[0], 2.0));
  // constant column keeps unit scale
  assert(Near(scaler.Scales()[1], 1.0));

  std::vector<double> row = {9.0, 5.0};
  scaler.Transform(row);
  assert(Near(row[0], 2.0));
  assert(Near(row[1], 0.0));
}

void TestWidthMismatchThrows() {
  std::vector<FeatureRow> rows = {{1.0, 2.0}};
  auto                    imputer = MedianImputer::Fit(rows, 2);

  bool threw = false;
  try {
    (void)imputer.Transform({1.0});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)MedianImputer::Fit({{1.0, 2.0, 3.0}}, 2);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto scaler = StandardScaler::Fit({{1.0, 2.0}, {3.0, 4.0}}, 2);
  threw       = false;
  try {
    std::vector<double> wide = {1.0, 2.0, 3.0};
    scaler.Transform(wide);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMedianIgnoresMissingAndNonFinite();
  TestTransformFillsAndCounts();
  TestScalerUsesPopulationDeviation();
  TestWidthMismatchThrows();

  std::cout << "bridgewatch_unit_preprocessing: pass\n";
  return 0;
}
