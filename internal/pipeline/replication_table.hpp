#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/batch_writer.hpp"
#include "internal/db/api/result.hpp"

namespace replication::db {
class SortedStore;
}

namespace replication::pipeline {

/*
  Lifecycle of the replication table.

  All calls are idempotent; every component calls them lazily before its
  first write instead of relying on a bootstrap step.
*/
class ReplicationTable {
 public:
  static constexpr int                       kCreateAttempts = 5;
  static constexpr std::chrono::milliseconds kCreateRetryDelay{1000};

  // Creates the table when missing. Returns false only after every attempt failed.
  static bool EnsureExists(db::SortedStore& store, std::chrono::milliseconds retry_delay = kCreateRetryDelay);

  // Attaches the status combiner to every column unless already attached.
  static bool Configure(db::SortedStore& store);

  // Attaches the status combiner to the replication family of `table`.
  static bool ConfigureMetadataTable(db::SortedStore& store, const std::string& table);

  static db::Result CreateBatchWriter(db::SortedStore& store, std::unique_ptr<db::BatchWriter>* out);
};

} // namespace replication::pipeline
