#ifndef MANAGER_EVENT_LOGGER_HPP
#define MANAGER_EVENT_LOGGER_HPP

#include <string>
#include <thread>

#include "manager/event_queue.hpp"
#include "proto/event.pb.h"

namespace manager {

// Forwards all the events of a queue to the log, from its own thread.
class EventLogger {
 public:
  explicit EventLogger(EventQueue* queue);
  // Stops the queue and waits until all of its events have been logged.
  ~EventLogger();

  // Returns a one-line description of an event.
  static std::string Describe(const proto::Event& event);

  EventLogger(const EventLogger&) = delete;
  EventLogger& operator=(const EventLogger&) = delete;
  EventLogger(EventLogger&&) = delete;
  EventLogger& operator=(EventLogger&&) = delete;

 private:
  EventQueue* queue_;
  std::thread thread_;
};

}  // namespace manager

#endif
