#include "manager/event_logger.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace manager {

EventLogger::EventLogger(EventQueue* queue) : queue_(queue) {
  thread_ = std::thread([this] {
    absl::optional<proto::Event> event;
    while ((event = queue_->Dequeue())) {
      if (event->event_oneof_case() == proto::Event::kFailed) {
        LOG(WARNING) << Describe(*event);
      } else {
        LOG(INFO) << Describe(*event);
      }
    }
  });
}

EventLogger::~EventLogger() {
  queue_->Stop();
  thread_.join();
}

std::string EventLogger::Describe(const proto::Event& event) {
  std::string prefix = absl::StrCat("[", event.request_id(), "] ");
  switch (event.event_oneof_case()) {
    case proto::Event::kQueued:
      return absl::StrCat(prefix, "queued, ", event.queued().running(), "/",
                          event.queued().capacity(), " running");
    case proto::Event::kStarted:
      return absl::StrCat(prefix, "started, ", event.started().code_size(),
                          " bytes of code, timeout ",
                          event.started().timeout_s(), "s");
    case proto::Event::kFinished: {
      const proto::ExecutionResult& result = event.finished().result();
      std::string status =
          result.has_exit_code()
              ? absl::StrCat("exit code ", result.exit_code())
              : std::string("no exit code");
      return absl::StrCat(prefix, "finished, ", status, ", ",
                          result.duration_ms(), "ms",
                          result.truncated() ? ", output truncated" : "");
    }
    case proto::Event::kTimedOut:
      return absl::StrCat(prefix, "timed out after ",
                          event.timed_out().duration_ms(), "ms");
    case proto::Event::kFailed:
      return absl::StrCat(
          prefix, "failed (",
          proto::FailedEvent::Kind_Name(event.failed().kind()),
          "): ", event.failed().message());
    case proto::Event::EVENT_ONEOF_NOT_SET:
      break;
  }
  return absl::StrCat(prefix, "empty event");
}

}  // namespace manager
