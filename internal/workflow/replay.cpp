#include "replay.hpp"

#include "internal/history/events.hpp"
#include "internal/util/errors.hpp"

namespace weave::workflow {

using namespace weave::v1;

class Replayer {
 public:
  static ReplayResult Run(WorkflowDefinition& definition, const std::string& run_id, const std::vector<HistoryEvent>& history);
};

namespace {

std::optional<EventType> CloseEventIn(const std::vector<HistoryEvent>& history) {
  for (const auto& event : history) {
    if (history::IsCloseEvent(event.event_type())) return event.event_type();
  }
  return std::nullopt;
}

WorkflowStatus StatusOf(const Command& command) {
  if (std::holds_alternative<CompleteWorkflowCommand>(command)) return WORKFLOW_STATUS_COMPLETED;
  if (std::holds_alternative<FailWorkflowCommand>(command)) return WORKFLOW_STATUS_FAILED;
  return WORKFLOW_STATUS_RUNNING;
}

FailWorkflowCommand MakeFail(const std::string& category, const std::string& message) {
  FailWorkflowCommand fail;
  fail.failure = history::MakeFailure(category, message);
  return fail;
}

} // namespace

ReplayResult Replayer::Run(WorkflowDefinition& definition, const std::string& run_id, const std::vector<HistoryEvent>& history) {
  ReplayResult result;
  result.state.history_length = history.size();

  if (history.empty() || history.front().event_type() != EVENT_TYPE_WORKFLOW_STARTED) {
    throw util::InvalidArgument("replay: history of run " + run_id + " does not begin with WorkflowStarted");
  }

  // closed runs produce nothing
  if (auto closed = CloseEventIn(history)) {
    result.state.status = history::StatusAfter(*closed);
    return result;
  }

  WorkflowContext ctx(run_id, history);
  result.state.cancel_requested = ctx.IsCancelRequested();

  bool suspended = false;
  try {
    definition.Run(ctx);
  } catch (const WorkflowSuspended&) {
    suspended = true;
  } catch (const util::NondeterminismDetected&) {
    throw;
  } catch (const ActivityError& e) {
    FailWorkflowCommand fail;
    fail.failure = e.Failure();
    ctx.close_   = std::move(fail);
  } catch (const std::exception& e) {
    ctx.close_ = MakeFail(kWorkflowErrorCategory, e.what());
  }

  // every recorded schedule must be requested again unless the workflow
  // took a different, closing path
  if (!ctx.close_.has_value() && ctx.call_index_ < ctx.recorded_.size()) {
    const auto& missing = ctx.recorded_[ctx.call_index_];
    throw util::NondeterminismDetected("run " + run_id + ": history event " + std::to_string(missing.sequence) + " recorded " +
                                       missing.id + " which replay never requested");
  }

  if (!ctx.close_.has_value() && ctx.IsCancelRequested()) {
    // canceled and the workflow did not close itself
    ctx.close_ = MakeFail(kCanceledCategory, ctx.CancelReason().empty() ? "workflow canceled" : ctx.CancelReason());
  }

  if (!ctx.close_.has_value() && !suspended && ctx.pending_ == 0) {
    ctx.close_ = CompleteWorkflowCommand{};
  }

  // closing supersedes anything scheduled in the same cycle
  if (ctx.close_.has_value()) {
    ctx.new_commands_.clear();
    ctx.pending_ = 0;
  }

  result.commands = std::move(ctx.new_commands_);
  if (ctx.close_.has_value()) {
    result.state.status = StatusOf(*ctx.close_);
    result.commands.push_back(std::move(*ctx.close_));
  }
  result.state.pending = ctx.pending_;
  if (suspended && !ctx.close_.has_value()) result.state.awaited_signal = ctx.awaited_signal_;
  return result;
}

ReplayResult Replay(WorkflowDefinition& definition, const std::string& run_id, const std::vector<HistoryEvent>& history) {
  return Replayer::Run(definition, run_id, history);
}

} // namespace weave::workflow
