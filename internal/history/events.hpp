#pragma once

#include <string>

#include "weave/v1/common.pb.h"
#include "weave/v1/history.pb.h"

namespace weave::history {

// Event with type and wall-clock time set; attributes left to the caller.
weave::v1::HistoryEvent NewEvent(weave::v1::EventType type);

bool IsCloseEvent(weave::v1::EventType type);

// Run status after applying a close event; RUNNING for anything else.
weave::v1::WorkflowStatus StatusAfter(weave::v1::EventType type);

const char* EventTypeName(weave::v1::EventType type);

weave::v1::Failure MakeFailure(const std::string& category, const std::string& message, bool non_retryable = false);

} // namespace weave::history
