#pragma once

#include <cstdint>
#include <string>

namespace weave::db::model {

/*
  One history event, keyed by (run_id, sequence).

  data holds the serialized weave.v1.HistoryEvent; event_type and
  event_time_ms are denormalized for inspection.
*/
struct EventRecord {
  std::string run_id;
  uint64_t    sequence      = 0;
  int32_t     event_type    = 0;
  uint64_t    event_time_ms = 0;
  std::string data;
};

}
