#include "manager/event_queue.hpp"

namespace manager {

void EventQueue::Enqueue(proto::Event&& event) {
  absl::MutexLock lck(&queue_mutex_);
  queue_.push(std::move(event));
}

bool EventQueue::Ready() const { return stopped_ || !queue_.empty(); }

absl::optional<proto::Event> EventQueue::Dequeue() {
  queue_mutex_.LockWhen(absl::Condition(this, &EventQueue::Ready));
  absl::optional<proto::Event> event;
  if (!queue_.empty()) {
    event = std::move(queue_.front());
    queue_.pop();
  }
  queue_mutex_.Unlock();
  return event;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}

}  // namespace manager
