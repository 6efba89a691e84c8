#include "memory_store.hpp"

#include <optional>

#include "memory_batch_writer.hpp"

namespace replication::db::memory {

MemoryStore::MemoryStore() = default;

bool MemoryStore::TableExists(const std::string& table) {
  std::scoped_lock lock(mutex_);
  return tables_.contains(table);
}

Result MemoryStore::CreateTable(const std::string& table) {
  std::scoped_lock lock(mutex_);
  if (tables_.contains(table)) return Result::Err(ErrorCode::AlreadyExists, table);
  tables_.emplace(table, Table{});
  return Result::Ok();
}

std::vector<std::string> MemoryStore::ListCombiners(const std::string& table) {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> names;
  auto                     it = tables_.find(table);
  if (it == tables_.end()) return names;
  for (const auto& setting : it->second.combiners) {
    names.push_back(setting.name);
  }
  return names;
}

Result MemoryStore::AttachCombiner(const std::string& table, const CombinerSetting& setting) {
  if (!setting.combiner) return Result::Err(ErrorCode::InternalError, "combiner '" + setting.name + "' has no implementation");

  std::scoped_lock lock(mutex_);
  auto             it = tables_.find(table);
  if (it == tables_.end()) return Result::Err(ErrorCode::NotFound, table);

  for (auto& existing : it->second.combiners) {
    if (existing.name == setting.name) {
      existing = setting;
      return Result::Ok();
    }
  }
  it->second.combiners.push_back(setting);
  return Result::Ok();
}

Result MemoryStore::SetTableProperty(const std::string& table, const std::string& key, const std::string& value) {
  std::scoped_lock lock(mutex_);
  auto             it = tables_.find(table);
  if (it == tables_.end()) return Result::Err(ErrorCode::NotFound, table);
  it->second.properties[key] = value;
  return Result::Ok();
}

Result MemoryStore::GetTableProperties(const std::string& table, const std::string& prefix, std::map<std::string, std::string>* out) {
  std::scoped_lock lock(mutex_);
  auto             it = tables_.find(table);
  if (it == tables_.end()) return Result::Err(ErrorCode::NotFound, table);

  out->clear();
  for (auto prop = it->second.properties.lower_bound(prefix); prop != it->second.properties.end(); ++prop) {
    if (prop->first.compare(0, prefix.size(), prefix) != 0) break;
    out->emplace(prop->first, prop->second);
  }
  return Result::Ok();
}

Result MemoryStore::Scan(const std::string& table, const ScanOptions& options, std::vector<Entry>* out) {
  std::scoped_lock lock(mutex_);
  auto             it = tables_.find(table);
  if (it == tables_.end()) return Result::Err(ErrorCode::NotFound, table);

  out->clear();
  const auto& cells = it->second.cells;
  auto        cell  = options.range.start_row ? cells.lower_bound(Key{*options.range.start_row, {}, {}}) : cells.begin();
  for (; cell != cells.end(); ++cell) {
    if (!options.range.Contains(cell->first.row)) break;
    if (!options.AcceptsFamily(cell->first.family)) continue;
    out->push_back({cell->first, cell->second});
  }
  return Result::Ok();
}

Result MemoryStore::CreateBatchWriter(const std::string& table, std::unique_ptr<BatchWriter>* out) {
  if (!TableExists(table)) return Result::Err(ErrorCode::NotFound, table);
  *out = std::make_unique<MemoryBatchWriter>(*this, table);
  return Result::Ok();
}

Result MemoryStore::Apply(const std::string& table, const std::vector<Mutation>& mutations) {
  std::scoped_lock lock(mutex_);
  auto             it = tables_.find(table);
  if (it == tables_.end()) return Result::Err(ErrorCode::Rejected, "table '" + table + "' no longer exists");

  auto& state = it->second;

  // Staged against an overlay so a failing combine leaves the table untouched.
  std::map<Key, std::optional<std::string>> overlay;
  auto current = [&](const Key& key) -> std::optional<std::string> {
    if (auto staged = overlay.find(key); staged != overlay.end()) return staged->second;
    if (auto cell = state.cells.find(key); cell != state.cells.end()) return cell->second;
    return std::nullopt;
  };

  for (const auto& mutation : mutations) {
    for (const auto& update : mutation.Updates()) {
      Key key{mutation.Row(), update.family, update.qualifier};
      if (update.deleted) {
        overlay[key] = std::nullopt;
        continue;
      }

      auto existing = current(key);
      if (!existing) {
        overlay[key] = update.value;
        continue;
      }

      std::string merged   = update.value;
      bool        combined = false;
      for (const auto& setting : state.combiners) {
        if (!setting.AppliesTo(update.family)) continue;
        std::string out;
        auto        rc = setting.combiner->Combine(combined ? merged : *existing, update.value, &out);
        if (!rc) {
          return Result::Err(ErrorCode::Rejected, "combiner '" + setting.name + "' failed for row '" + mutation.Row() + "': " + rc.message);
        }
        merged   = std::move(out);
        combined = true;
      }
      overlay[key] = std::move(merged);
    }
  }

  for (auto& [key, value] : overlay) {
    if (value) {
      state.cells[key] = std::move(*value);
    } else {
      state.cells.erase(key);
    }
  }
  return Result::Ok();
}

} // namespace replication::db::memory
