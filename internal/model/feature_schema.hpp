#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bridgewatch::model {

using FeatureValue = std::optional<double>;
using FeatureRow   = std::vector<FeatureValue>;

using TextValue = std::optional<std::string>;
using TextRow   = std::vector<TextValue>;

/*
  Ordered set of stored telemetry channels plus the table they live in.

  Channels are numeric and may feed the model. Text columns (free-form
  dataset labels such as the mood meter) are stored and carried through
  replay but never projected into a FeatureRow.

  Channel, text column and table names are spliced into SQL, so they are restricted to
  lower-case identifiers: [a-z_][a-z0-9_]*
*/
class FeatureSchema {
 public:
  FeatureSchema(std::string table, std::vector<std::string> channels, std::vector<std::string> text_columns = {});

  const std::string&              Table() const { return table_; }
  const std::vector<std::string>& Channels() const { return channels_; }
  const std::vector<std::string>& TextColumns() const { return text_columns_; }
  std::size_t                     Width() const { return channels_.size(); }
  std::size_t                     TextWidth() const { return text_columns_.size(); }

  std::optional<std::size_t> IndexOf(const std::string& channel) const;

  static bool IsValidIdentifier(const std::string& name);

 private:
  std::string              table_;
  std::vector<std::string> channels_;
  std::vector<std::string> text_columns_;
};

/*
  Maps the model's feature list onto positions in a stored FeatureRow.
*/
class FeatureProjection {
 public:
  FeatureProjection(const FeatureSchema& schema, const std::vector<std::string>& features);

  FeatureRow Project(const FeatureRow& stored) const;

  const std::vector<std::string>& Names() const { return names_; }
  std::size_t                     Width() const { return indices_.size(); }

 private:
  std::vector<std::string> names_;
  std::vector<std::size_t> indices_;
};

// Numeric channels of the bridge sensor dataset.
const std::vector<std::string>& DefaultChannels();

// Text columns of the bridge sensor dataset.
const std::vector<std::string>& DefaultTextColumns();

// Structural channels used by the anomaly model unless configured otherwise.
const std::vector<std::string>& DefaultModelFeatures();

inline constexpr const char* kDefaultTable = "bridge_telemetry";

} // namespace bridgewatch::model
