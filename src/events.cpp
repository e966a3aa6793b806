// -----------------------------------------------------------------------------
// events.cpp — Event records and the bounded EventLog.
//
// API & field descriptions: see include/largeobj/events.hpp
// -----------------------------------------------------------------------------
#include "largeobj/events.hpp"

namespace largeobj {

const char* to_string(EventLevel level) {
  switch (level) {
    case EventLevel::Info:  return "info";
    case EventLevel::Warn:  return "warn";
    case EventLevel::Error: return "error";
  }
  return "info";
}

Event::Event(EventLevel lvl, const char* event_name, const char* event_text, int64_t v)
: level(lvl), value(v) {
  if (event_name) name.assign(event_name);   // ETL truncates at capacity
  if (event_text) text.assign(event_text);
}

Event& Event::append(const char* s) {
  if (!s) return *this;
  while (*s && !text.full()) text += *s++;
  return *this;
}

// append_number() — decimal conversion into the fixed text buffer.
// POLICY:
//   - No heap, no sprintf; digits are built reversed then copied.
//   - Stops silently when `text` is full.
Event& Event::append_number(uint64_t n) {
  char buf[20];                        // u64 max is 20 digits
  int idx = 0;

  if (n == 0) {
    if (!text.full()) text += '0';
    return *this;
  }

  while (n > 0 && idx < static_cast<int>(sizeof(buf))) {
    buf[idx++] = static_cast<char>('0' + (n % 10));
    n /= 10;
  }

  for (int i = idx - 1; i >= 0 && !text.full(); --i) text += buf[i];
  return *this;
}

// record() — enqueue, evicting the oldest entry when full.
// POLICY:
//   - Never refuses an event: a full log drops its oldest entry.
void EventLog::record(const Event& ev) {
  if (events_.full()) {
    events_.pop_front();
    ++dropped_;
  }
  events_.push_back(ev);
}

bool EventLog::get_event(Event& out) {
  if (events_.empty()) return false;
  out = events_.front();
  events_.pop_front();
  return true;
}

} // namespace largeobj
