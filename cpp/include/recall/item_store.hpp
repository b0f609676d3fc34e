#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recall {

// Persistence consumed by the engine. Implementations report write failures with
// StorageError and stale session versions with ConflictError.
class ItemStore {
public:
  virtual ~ItemStore() = default;

  // Items of `topic_id` in any of `learning_path_ids`; an empty list means every path.
  virtual std::vector<ContentItem> load_pool(const std::string& topic_id,
                                             const std::vector<std::string>& learning_path_ids) = 0;

  // Records for the ids that have one. Ids without a record are simply absent.
  virtual RecordMap load_records(const std::vector<std::string>& item_ids) = 0;

  virtual void save_record(const SchedulingRecord& record) = 0;

  // Stores `session` if its version matches the stored one (0 = not stored yet) and
  // returns the new version.
  virtual std::uint64_t save_session(const PracticeSession& session) = 0;

  virtual std::optional<PracticeSession> load_session(const std::string& session_id) = 0;
};

class InMemoryItemStore : public ItemStore {
public:
  InMemoryItemStore() = default;
  explicit InMemoryItemStore(std::vector<ContentItem> items);

  std::vector<ContentItem> load_pool(const std::string& topic_id,
                                     const std::vector<std::string>& learning_path_ids) override;
  RecordMap load_records(const std::vector<std::string>& item_ids) override;
  void save_record(const SchedulingRecord& record) override;
  std::uint64_t save_session(const PracticeSession& session) override;
  std::optional<PracticeSession> load_session(const std::string& session_id) override;

  // Replaces an item with the same id.
  void add_item(ContentItem item);
  void put_record(SchedulingRecord record);

  std::optional<SchedulingRecord> record(const std::string& item_id) const;
  std::size_t item_count() const noexcept { return items_.size(); }
  std::vector<SchedulingRecord> all_records() const;

  // The next `count` writes (records or sessions) throw StorageError.
  void fail_next_writes(int count) noexcept { failing_writes_ = count; }

  // Simulates an external writer: bumps the stored version of `session_id`.
  void touch_session(const std::string& session_id);

  std::size_t record_writes() const noexcept { return record_writes_; }
  std::size_t session_writes() const noexcept { return session_writes_; }

private:
  void check_write(const std::string& what);

  std::vector<ContentItem> items_;
  std::unordered_map<std::string, SchedulingRecord> records_;
  std::unordered_map<std::string, PracticeSession> sessions_;
  int failing_writes_ = 0;
  std::size_t record_writes_ = 0;
  std::size_t session_writes_ = 0;
};

} // namespace recall
