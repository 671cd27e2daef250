#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "weave/v1/history.pb.h"

namespace weave::history {

/*
  Lazy, restartable cursor over one run's history.

  Pages through the store in fixed-size batches, each batch in its own
  short transaction. Position() is the last sequence handed out; a new
  cursor started from it resumes exactly where this one stopped.
*/
class HistoryCursor {
 public:
  HistoryCursor(std::shared_ptr<db::Repository> repo, std::string run_id, uint64_t from_sequence, uint64_t page_size);

  // false once the log is exhausted
  bool Next(weave::v1::HistoryEvent& out);

  uint64_t Position() const {
    return position_;
  }

 private:
  void Fill();

  std::shared_ptr<db::Repository> repo_;
  std::string                     run_id_;
  uint64_t                        position_;
  uint64_t                        page_size_;

  std::vector<db::model::EventRecord> page_;
  size_t                              page_index_ = 0;
  bool                                exhausted_  = false;
};

/*
  Append-only, per-run ordered event log.

  The run row is a projection of the log: Append creates it on
  WorkflowStarted and keeps status, version, update time and close
  payload in step with the events, inside the same transaction.
*/
class EventLog {
 public:
  explicit EventLog(std::shared_ptr<db::Repository> repo, uint64_t page_size = 256);

  /*
    Appends events after expected_version and returns the new version.

    Throws:
      ConcurrencyConflict  expected_version is not the current version
      InvalidState         the run is closed
      NotFound             the run does not exist
  */
  uint64_t Append(const std::string& run_id, uint64_t expected_version, std::vector<weave::v1::HistoryEvent> events);

  // Same, inside a caller-owned transaction. Sequences are written back into events.
  uint64_t Append(db::Transaction& tx, const std::string& run_id, uint64_t expected_version, std::vector<weave::v1::HistoryEvent>& events);

  HistoryCursor Read(const std::string& run_id, uint64_t from_version = 0) const;

  std::vector<weave::v1::HistoryEvent> ReadAll(const std::string& run_id) const;
  std::vector<weave::v1::HistoryEvent> ReadAll(db::Transaction& tx, const std::string& run_id) const;

  uint64_t Version(db::Transaction& tx, const std::string& run_id) const;

  db::Repository& Repository() const {
    return *repo_;
  }

 private:
  std::shared_ptr<db::Repository> repo_;
  uint64_t                        page_size_;
};

} // namespace weave::history
