#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <queue>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/event.pb.h"

namespace manager {

// Queue of the events produced by the executions. Any number of threads can
// push events, consumers block in Dequeue.
class EventQueue {
 public:
  void Queued(int64_t request_id, int32_t running, int32_t capacity) {
    proto::Event event;
    event.set_request_id(request_id);
    auto* sub_event = event.mutable_queued();
    sub_event->set_running(running);
    sub_event->set_capacity(capacity);
    Enqueue(std::move(event));
  }
  void Started(int64_t request_id, double timeout_s, int64_t code_size) {
    proto::Event event;
    event.set_request_id(request_id);
    auto* sub_event = event.mutable_started();
    sub_event->set_timeout_s(timeout_s);
    sub_event->set_code_size(code_size);
    Enqueue(std::move(event));
  }
  void Finished(int64_t request_id, const proto::ExecutionResult& result) {
    proto::Event event;
    event.set_request_id(request_id);
    *event.mutable_finished()->mutable_result() = result;
    Enqueue(std::move(event));
  }
  void TimedOut(int64_t request_id, int64_t duration_ms) {
    proto::Event event;
    event.set_request_id(request_id);
    event.mutable_timed_out()->set_duration_ms(duration_ms);
    Enqueue(std::move(event));
  }
  void Failed(int64_t request_id, proto::FailedEvent::Kind kind,
              const std::string& message) {
    proto::Event event;
    event.set_request_id(request_id);
    auto* sub_event = event.mutable_failed();
    sub_event->set_kind(kind);
    sub_event->set_message(message);
    Enqueue(std::move(event));
  }

  // Blocks until an event is available, and returns it. Returns an empty
  // optional once the queue is stopped and every event has been consumed.
  absl::optional<proto::Event> Dequeue();
  // Wakes up the consumers. Events pushed after Stop are still delivered.
  void Stop();
  bool IsStopped() {
    absl::MutexLock lck(&queue_mutex_);
    return stopped_;
  }

 private:
  absl::Mutex queue_mutex_;
  std::queue<proto::Event> queue_ GUARDED_BY(queue_mutex_);
  bool stopped_ GUARDED_BY(queue_mutex_) = false;
  void Enqueue(proto::Event&& event);
  bool Ready() const EXCLUSIVE_LOCKS_REQUIRED(queue_mutex_);
};

}  // namespace manager

#endif
