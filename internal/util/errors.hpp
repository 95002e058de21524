#pragma once

#include <stdexcept>
#include <string>

namespace bridgewatch::util {

/*
  Central error types for the pipeline.

  Store failures have their own hierarchy in internal/db/api/errors.hpp.
  Everything here is fatal for the process that raises it.
*/

// Training was asked to fit on a snapshot with no rows.
class EmptyTrainingSet : public std::runtime_error {
 public:
  explicit EmptyTrainingSet(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The historical CSV is unreadable or does not carry the configured channels.
class DatasetError : public std::runtime_error {
 public:
  explicit DatasetError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Seeding refused because the store already holds records.
class StoreNotEmpty : public std::runtime_error {
 public:
  explicit StoreNotEmpty(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::logic_error {
 public:
  explicit InvalidState(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace bridgewatch::util
