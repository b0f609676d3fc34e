#include "recall/item_store.hpp"

#include "recall/errors.hpp"

#include <algorithm>
#include <utility>

namespace recall {

InMemoryItemStore::InMemoryItemStore(std::vector<ContentItem> items) {
  for (auto& item : items) {
    add_item(std::move(item));
  }
}

void InMemoryItemStore::add_item(ContentItem item) {
  auto it = std::find_if(items_.begin(), items_.end(),
                         [&](const ContentItem& existing) { return existing.id == item.id; });
  if (it != items_.end()) {
    *it = std::move(item);
    return;
  }
  items_.push_back(std::move(item));
}

void InMemoryItemStore::put_record(SchedulingRecord record) {
  std::string id = record.item_id;
  records_[id] = std::move(record);
}

std::vector<ContentItem> InMemoryItemStore::load_pool(
    const std::string& topic_id, const std::vector<std::string>& learning_path_ids) {
  std::vector<ContentItem> pool;
  for (const auto& item : items_) {
    if (item.topic_id != topic_id) {
      continue;
    }
    if (!learning_path_ids.empty() &&
        std::find(learning_path_ids.begin(), learning_path_ids.end(), item.learning_path_id) ==
            learning_path_ids.end()) {
      continue;
    }
    pool.push_back(item);
  }
  return pool;
}

RecordMap InMemoryItemStore::load_records(const std::vector<std::string>& item_ids) {
  RecordMap found;
  for (const auto& id : item_ids) {
    auto it = records_.find(id);
    if (it != records_.end()) {
      found.emplace(id, it->second);
    }
  }
  return found;
}

void InMemoryItemStore::check_write(const std::string& what) {
  if (failing_writes_ > 0) {
    --failing_writes_;
    throw StorageError("Injected storage failure while writing " + what);
  }
}

void InMemoryItemStore::save_record(const SchedulingRecord& record) {
  check_write("record '" + record.item_id + "'");
  records_[record.item_id] = record;
  ++record_writes_;
}

std::uint64_t InMemoryItemStore::save_session(const PracticeSession& session) {
  auto it = sessions_.find(session.id);
  const std::uint64_t stored = it == sessions_.end() ? 0 : it->second.version;
  if (stored != session.version) {
    throw ConflictError(session.id, session.version, stored);
  }
  check_write("session '" + session.id + "'");
  PracticeSession copy = session;
  copy.version = stored + 1;
  sessions_[session.id] = std::move(copy);
  ++session_writes_;
  return stored + 1;
}

std::optional<PracticeSession> InMemoryItemStore::load_session(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<SchedulingRecord> InMemoryItemStore::record(const std::string& item_id) const {
  auto it = records_.find(item_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<SchedulingRecord> InMemoryItemStore::all_records() const {
  std::vector<SchedulingRecord> out;
  out.reserve(records_.size());
  for (const auto& entry : records_) {
    out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(), [](const SchedulingRecord& a, const SchedulingRecord& b) {
    return a.item_id < b.item_id;
  });
  return out;
}

void InMemoryItemStore::touch_session(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw std::out_of_range("Unknown session id: " + session_id);
  }
  ++it->second.version;
}

} // namespace recall
