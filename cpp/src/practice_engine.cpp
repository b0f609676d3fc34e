#include "recall/practice_engine.hpp"

#include "debug_log.hpp"
#include "recall/errors.hpp"
#include "rng.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace recall {
namespace {

void log_session(const std::string& message) {
  detail::debug_log("session", message);
}

struct SessionData {
  std::unique_ptr<SessionMachine> machine;
  // Latest record per item that has not reached the store yet.
  std::map<std::string, SchedulingRecord> pending_records;
  bool session_dirty = false;
};

std::vector<std::string> item_ids_of(const std::vector<ContentItem>& items) {
  std::vector<std::string> ids;
  ids.reserve(items.size());
  for (const auto& item : items) {
    ids.push_back(item.id);
  }
  return ids;
}

std::vector<SchedulingRecord> records_of(const RecordMap& records) {
  std::vector<SchedulingRecord> out;
  out.reserve(records.size());
  for (const auto& entry : records) {
    out.push_back(entry.second);
  }
  return out;
}

} // namespace

void EngineConfig::validate() const {
  scheduler.validate();
  if (session_prefix.empty()) {
    throw std::invalid_argument("session_prefix must not be empty");
  }
}

class PracticeEngineImpl : public PracticeEngine {
public:
  PracticeEngineImpl(ItemStore& store, EngineConfig config)
      : store_(store), config_(std::move(config)) {
    config_.validate();
    rng_state_ = seed_rng(config_.seed);
  }

  CreatedSession create_session(const SessionConfiguration& configuration,
                                TimestampMs now) override {
    if (configuration.target_count <= 0) {
      throw std::invalid_argument("target_count must be positive, got " +
                                  std::to_string(configuration.target_count));
    }
    auto pool = store_.load_pool(configuration.topic_id, configuration.learning_path_ids);
    auto records = store_.load_records(item_ids_of(pool));

    // Compose on a copy so a failed creation leaves the engine rng untouched.
    std::uint64_t rng = rng_state_;
    Composition composition =
        compose(pool, records, configuration, now, rng, config_.ordering);

    PracticeSession session;
    session.id = generate_session_id(now);
    session.configuration = configuration;
    session.execution.task_ids = composition.task_ids;

    std::ostringstream oss;
    oss << session.id << ": composed " << composition.task_ids.size() << "/"
        << composition.target_count << " tasks (" << composition.due_count << " due, "
        << composition.new_count << " new) from a pool of " << pool.size();
    if (composition.underflow()) {
      oss << " [underflow]";
    }
    log_session(oss.str());

    RecordMap session_records;
    for (const auto& id : composition.task_ids) {
      auto it = records.find(id);
      if (it != records.end()) {
        session_records.emplace(id, it->second);
      }
    }

    SessionData data;
    data.machine = std::make_unique<SessionMachine>(std::move(session), pool,
                                                    std::move(session_records), config_.scheduler);
    try {
      const std::uint64_t version = store_.save_session(data.machine->session());
      data.machine->set_version(version);
    } catch (const Error& e) {
      log_session(data.machine->session().id + ": initial save failed, session discarded: " +
                  e.what());
      throw;
    }

    rng_state_ = rng;
    CreatedSession created{data.machine->session().id, std::move(composition)};
    sessions_.emplace(created.session_id, std::move(data));
    return created;
  }

  SessionSnapshot start(const std::string& session_id, TimestampMs now) override {
    auto& data = get_session(session_id);
    data.machine->start(now);
    data.session_dirty = true;
    persist(session_id, data);
    return data.machine->snapshot();
  }

  SubmitOutcome submit_answer(const std::string& session_id, const Submission& submission,
                              TimestampMs now) override {
    auto& data = get_session(session_id);
    SubmitOutcome outcome = data.machine->submit_answer(submission, now);
    if (outcome.duplicate) {
      log_session(session_id + ": duplicate submission absorbed");
      return outcome;
    }
    if (outcome.updated_record.has_value()) {
      const auto& record = *outcome.updated_record;
      data.pending_records[record.item_id] = record;
    }
    data.session_dirty = true;
    persist(session_id, data);
    return outcome;
  }

  SessionSnapshot skip(const std::string& session_id, TimestampMs now) override {
    auto& data = get_session(session_id);
    data.machine->skip(now);
    data.session_dirty = true;
    persist(session_id, data);
    return data.machine->snapshot();
  }

  SessionSnapshot advance(const std::string& session_id, TimestampMs now) override {
    auto& data = get_session(session_id);
    data.machine->advance(now);
    data.session_dirty = true;
    persist(session_id, data);
    return data.machine->snapshot();
  }

  SessionSnapshot toggle_hint(const std::string& session_id) override {
    auto& data = get_session(session_id);
    data.machine->toggle_hint();
    return data.machine->snapshot();
  }

  SessionSnapshot cancel(const std::string& session_id, TimestampMs now) override {
    auto& data = get_session(session_id);
    data.machine->cancel(now);
    data.session_dirty = true;
    persist(session_id, data);
    return data.machine->snapshot();
  }

  SessionSnapshot finish(const std::string& session_id, TimestampMs now) override {
    auto& data = get_session(session_id);
    data.machine->finish(now);
    data.session_dirty = true;
    persist(session_id, data);
    return data.machine->snapshot();
  }

  SessionSnapshot snapshot(const std::string& session_id) const override {
    return get_session(session_id).machine->snapshot();
  }

  std::size_t pending_writes(const std::string& session_id) const override {
    const auto& data = get_session(session_id);
    return data.pending_records.size() + (data.session_dirty ? 1 : 0);
  }

  void flush(const std::string& session_id) override {
    auto& data = get_session(session_id);
    if (data.pending_records.empty() && !data.session_dirty) {
      return;
    }
    log_session(session_id + ": retrying " + std::to_string(pending_writes(session_id)) +
                " pending write(s)");
    persist(session_id, data);
  }

  SessionSnapshot reload_session(const std::string& session_id) override {
    auto& data = get_session(session_id);
    auto stored = store_.load_session(session_id);
    if (!stored.has_value()) {
      throw std::out_of_range("Session '" + session_id + "' is not in the store");
    }
    const auto& configuration = stored->configuration;
    auto pool = store_.load_pool(configuration.topic_id, configuration.learning_path_ids);
    auto records = store_.load_records(stored->execution.task_ids);
    for (const auto& entry : data.pending_records) {
      records[entry.first] = entry.second;
    }

    auto machine = std::make_unique<SessionMachine>(std::move(*stored), pool, std::move(records),
                                                    config_.scheduler);
    log_session(session_id + ": reloaded at version " +
                std::to_string(machine->session().version));
    data.machine = std::move(machine);
    data.session_dirty = false;
    return data.machine->snapshot();
  }

  void close_session(const std::string& session_id) override {
    auto& data = get_session(session_id);
    persist(session_id, data);
    sessions_.erase(session_id);
  }

  std::vector<std::string> session_ids() const override {
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
      ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
  }

  scheduler::ScheduleStats schedule_stats(const std::string& topic_id,
                                          const std::vector<std::string>& learning_path_ids,
                                          TimestampMs now) override {
    auto pool = store_.load_pool(topic_id, learning_path_ids);
    auto records = store_.load_records(item_ids_of(pool));
    return scheduler::summarize(records_of(records), now);
  }

  std::vector<scheduler::DailyLoad> review_forecast(
      const std::string& topic_id, const std::vector<std::string>& learning_path_ids,
      TimestampMs now, int days) override {
    auto pool = store_.load_pool(topic_id, learning_path_ids);
    auto records = store_.load_records(item_ids_of(pool));
    return scheduler::review_forecast(records_of(records), now, days);
  }

  SchedulingRecord reschedule_item(const std::string& item_id, TimestampMs new_due_at,
                                   TimestampMs now) override {
    auto records = store_.load_records({item_id});
    auto it = records.find(item_id);
    const SchedulingRecord base =
        it == records.end() ? scheduler::make_initial_record(item_id, now) : it->second;
    SchedulingRecord moved = scheduler::reschedule(base, new_due_at);
    store_.save_record(moved);
    return moved;
  }

  const EngineConfig& config() const noexcept override { return config_; }

private:
  SessionData& get_session(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      throw std::out_of_range("Unknown session id: " + id);
    }
    return it->second;
  }

  const SessionData& get_session(const std::string& id) const {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      throw std::out_of_range("Unknown session id: " + id);
    }
    return it->second;
  }

  std::string generate_session_id(TimestampMs now) {
    return config_.session_prefix + "-" + std::to_string(now) + "-" +
           std::to_string(++session_counter_);
  }

  // Records first, then the session. Each successful write leaves the queue; the first
  // failure stops the flush and propagates.
  void persist(const std::string& session_id, SessionData& data) {
    for (auto it = data.pending_records.begin(); it != data.pending_records.end();) {
      try {
        store_.save_record(it->second);
      } catch (const StorageError& e) {
        log_session(session_id + ": record '" + it->first + "' not saved, queued: " + e.what());
        throw;
      }
      it = data.pending_records.erase(it);
    }
    if (!data.session_dirty) {
      return;
    }
    try {
      const std::uint64_t version = store_.save_session(data.machine->session());
      data.machine->set_version(version);
      data.session_dirty = false;
    } catch (const ConflictError& e) {
      log_session(session_id + ": " + e.what());
      throw;
    } catch (const StorageError& e) {
      log_session(session_id + ": session not saved, queued: " + e.what());
      throw;
    }
  }

  ItemStore& store_;
  EngineConfig config_;
  std::uint64_t rng_state_ = 1;
  std::size_t session_counter_ = 0;
  std::unordered_map<std::string, SessionData> sessions_;
};

std::unique_ptr<PracticeEngine> make_engine(ItemStore& store, EngineConfig config) {
  return std::make_unique<PracticeEngineImpl>(store, std::move(config));
}

} // namespace recall
