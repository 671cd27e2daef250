#include "event_log.hpp"

#include "events.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace weave::history {

using namespace weave::v1;

namespace {

HistoryEvent Decode(const db::model::EventRecord& record) {
  HistoryEvent event;
  if (!event.ParseFromString(record.data)) {
    throw std::runtime_error("corrupt history event: run=" + record.run_id + " sequence=" + std::to_string(record.sequence));
  }
  event.set_sequence(record.sequence);
  return event;
}

db::model::RunRecord StartedRun(const std::string& run_id, const HistoryEvent& event) {
  const auto& attrs = event.workflow_started();

  db::model::RunRecord run;
  run.run_id        = run_id;
  run.workflow_id   = attrs.workflow_id();
  run.workflow_type = attrs.workflow_type();
  run.task_queue    = attrs.task_queue();
  run.input         = attrs.input();
  run.status        = WORKFLOW_STATUS_RUNNING;
  run.created_at_ms = util::ToUnixMillis(util::FromProto(event.event_time()));

  const auto timeout = util::FromProto(attrs.execution_timeout());
  if (timeout.count() > 0) run.execution_deadline_ms = run.created_at_ms + static_cast<uint64_t>(timeout.count());
  return run;
}

void Project(db::model::RunRecord& run, const HistoryEvent& event) {
  const uint64_t at_ms = util::ToUnixMillis(util::FromProto(event.event_time()));
  run.last_sequence    = event.sequence();
  run.updated_at_ms    = at_ms;

  if (!IsCloseEvent(event.event_type())) return;

  run.status       = StatusAfter(event.event_type());
  run.closed_at_ms = at_ms;

  switch (event.event_type()) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
      run.result = event.workflow_completed().result();
      break;
    case EVENT_TYPE_WORKFLOW_FAILED:
      run.failure = event.workflow_failed().failure().SerializeAsString();
      break;
    case EVENT_TYPE_WORKFLOW_TERMINATED:
      run.failure = MakeFailure("Terminated", event.workflow_terminated().reason()).SerializeAsString();
      break;
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
      run.failure = MakeFailure("TimedOut", "workflow execution timeout").SerializeAsString();
      break;
    default:
      break;
  }
}

} // namespace

// ------------------------------------------------------------------
// HistoryCursor
// ------------------------------------------------------------------

HistoryCursor::HistoryCursor(std::shared_ptr<db::Repository> repo, std::string run_id, uint64_t from_sequence, uint64_t page_size)
    : repo_(std::move(repo)), run_id_(std::move(run_id)), position_(from_sequence), page_size_(page_size == 0 ? 1 : page_size) {
}

void HistoryCursor::Fill() {
  auto tx     = repo_->Begin();
  page_       = repo_->ReadEvents(*tx, run_id_, position_, page_size_);
  page_index_ = 0;
  tx->Commit();

  // a short page means the end of the log as of this read
  if (page_.size() < page_size_) exhausted_ = true;
}

bool HistoryCursor::Next(HistoryEvent& out) {
  if (page_index_ >= page_.size()) {
    if (exhausted_) return false;
    Fill();
    if (page_.empty()) return false;
  }

  out       = Decode(page_[page_index_++]);
  position_ = out.sequence();
  return true;
}

// ------------------------------------------------------------------
// EventLog
// ------------------------------------------------------------------

EventLog::EventLog(std::shared_ptr<db::Repository> repo, uint64_t page_size) : repo_(std::move(repo)), page_size_(page_size) {
}

uint64_t EventLog::Append(const std::string& run_id, uint64_t expected_version, std::vector<HistoryEvent> events) {
  auto           tx      = repo_->Begin();
  const uint64_t version = Append(*tx, run_id, expected_version, events);
  tx->Commit();
  return version;
}

uint64_t EventLog::Append(db::Transaction& tx, const std::string& run_id, uint64_t expected_version, std::vector<HistoryEvent>& events) {
  if (events.empty()) return expected_version;

  std::optional<db::model::RunRecord> run = repo_->GetRun(tx, run_id);
  bool                                creating = false;

  if (!run.has_value()) {
    if (expected_version != 0 || events.front().event_type() != EVENT_TYPE_WORKFLOW_STARTED) {
      throw util::NotFound("append: run not found: " + run_id);
    }
    run      = StartedRun(run_id, events.front());
    creating = true;
  } else if (run->status != WORKFLOW_STATUS_RUNNING) {
    throw util::InvalidState("append: run " + run_id + " is closed");
  } else if (run->last_sequence != expected_version) {
    throw util::ConcurrencyConflict("append: run " + run_id + " is at version " + std::to_string(run->last_sequence) + ", expected " +
                                    std::to_string(expected_version));
  }

  std::vector<db::model::EventRecord> records;
  records.reserve(events.size());

  uint64_t sequence = expected_version;
  bool     closed   = false;
  for (auto& event : events) {
    if (closed) throw util::InvalidState("append: events after a close event for run " + run_id);
    if (!event.has_event_time()) *event.mutable_event_time() = util::ToProto(util::Now());
    event.set_sequence(++sequence);
    closed = IsCloseEvent(event.event_type());

    db::model::EventRecord record;
    record.run_id        = run_id;
    record.sequence      = event.sequence();
    record.event_type    = static_cast<int32_t>(event.event_type());
    record.event_time_ms = util::ToUnixMillis(util::FromProto(event.event_time()));
    record.data          = event.SerializeAsString();
    records.push_back(std::move(record));

    Project(*run, event);
  }

  db::ThrowIfDbError(repo_->AppendEvents(tx, run_id, expected_version, records), "append events");

  if (creating) {
    db::ThrowIfDbError(repo_->InsertRun(tx, *run), "insert run");
  } else {
    db::ThrowIfDbError(repo_->UpdateRun(tx, *run), "update run");
  }
  return sequence;
}

HistoryCursor EventLog::Read(const std::string& run_id, uint64_t from_version) const {
  return HistoryCursor(repo_, run_id, from_version, page_size_);
}

std::vector<HistoryEvent> EventLog::ReadAll(const std::string& run_id) const {
  std::vector<HistoryEvent> out;
  auto                      cursor = Read(run_id);
  HistoryEvent              event;
  while (cursor.Next(event)) {
    out.push_back(event);
  }
  return out;
}

std::vector<HistoryEvent> EventLog::ReadAll(db::Transaction& tx, const std::string& run_id) const {
  std::vector<HistoryEvent> out;
  uint64_t                  after = 0;
  for (;;) {
    auto page = repo_->ReadEvents(tx, run_id, after, page_size_);
    for (const auto& record : page) {
      out.push_back(Decode(record));
      after = record.sequence;
    }
    if (page.size() < page_size_) break;
  }
  return out;
}

uint64_t EventLog::Version(db::Transaction& tx, const std::string& run_id) const {
  return repo_->LastEventSequence(tx, run_id);
}

} // namespace weave::history
