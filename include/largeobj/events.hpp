/**
 * @file events.hpp
 * @brief Telemetry events — fixed-size records and a bounded, drainable event log.
 *
 * @details
 * largeobj does not write logs itself. Components that have something worth
 * reporting (a consolidation, a failed restore, a rejected caller) build an
 * `Event` and hand it to an `EventSink`. The sink is the telemetry collaborator:
 * fire-and-forget, never fails, never blocks.
 *
 * `EventLog` is the stock sink. It is a bounded queue in the same shape as a
 * node outbox: producers push, the wrapper drains with `get_event()` and decides
 * where the lines go (stderr, a file, a metrics exporter).
 *
 * ```
 *  [Assembler / UploadService] ── record(Event) ──► EventLog (bounded deque)
 *                                                       │
 *                         wrapper loop ◄── get_event() ─┘
 * ```
 *
 * Memory is fixed: each Event is a handful of ETL strings; the log holds at
 * most `EVENT_LOG_CAP` of them. When full, the oldest event is evicted and
 * counted in `dropped()` so the wrapper can tell it missed something.
 */
#ifndef LARGEOBJ_EVENTS_HPP
#define LARGEOBJ_EVENTS_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/deque.h"
#include "etl/string.h"

namespace largeobj {

/// Severity of an event.
enum class EventLevel : uint8_t {
  Info  = 0,
  Warn  = 1,
  Error = 2
};

/// Lowercase level name ("info", "warn", "error").
const char* to_string(EventLevel level);

/// Event key type, e.g. "consolidate.ok" (doubles as a metric name).
using EventName = etl::string<24>;

/// Human-readable event text.
using EventText = etl::string<96>;

/**
 * @brief One telemetry record: level + metric-style name + text + numeric value.
 *
 * `value` carries the number a metrics backend would chart for `name`
 * (bytes consolidated, missing chunk count, ...). Text is truncated at capacity.
 */
struct Event {
  EventLevel level = EventLevel::Info;
  EventName  name;
  EventText  text;
  int64_t    value = 0;

  Event() = default;
  Event(EventLevel lvl, const char* event_name, const char* event_text, int64_t v = 0);

  /// Append a C string to `text` (truncates at capacity).
  Event& append(const char* s);

  /// Append an unsigned decimal number to `text` without heap use.
  Event& append_number(uint64_t n);
};

/**
 * @brief Telemetry collaborator interface.
 *
 * Implementations must not throw and must not block; callers treat `record()`
 * as fire-and-forget.
 */
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void record(const Event& ev) = 0;
};

/**
 * @class EventLog
 * @brief Bounded FIFO of events, drained by the host wrapper.
 */
class EventLog : public EventSink {
public:
  /// Maximum events held before the oldest is evicted.
  static constexpr size_t EVENT_LOG_CAP = 64;

  void record(const Event& ev) override;

  /**
   * @brief Pop the oldest event.
   * @retval true  `out` holds the event.
   * @retval false the log was empty; `out` untouched.
   */
  bool get_event(Event& out);

  size_t size() const { return events_.size(); }
  bool   empty() const { return events_.empty(); }

  /// Events evicted because the log was full (monotonic).
  uint32_t dropped() const { return dropped_; }

  void clear() { events_.clear(); }

private:
  etl::deque<Event, EVENT_LOG_CAP> events_;
  uint32_t dropped_{0};
};

/// Record `ev` if `sink` is non-null. Keeps call sites free of null checks.
inline void emit(EventSink* sink, const Event& ev) {
  if (sink) sink->record(ev);
}

} // namespace largeobj

#endif // LARGEOBJ_EVENTS_HPP
