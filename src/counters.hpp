/*
 *
 *  counters.hpp
 *
 *  Counters shared by the client components
 *
 */

#ifndef RDC_COUNTERS_HPP_
#define RDC_COUNTERS_HPP_

#include <atomic>
#include <cstdint>

#include "rdc/stats.hpp"

namespace rdc {

struct Counters {
  std::atomic<uint64_t> pollers_started{0};
  std::atomic<uint64_t> handshakes{0};
  std::atomic<uint64_t> writes_submitted{0};
  std::atomic<uint64_t> writes_completed{0};
  std::atomic<uint64_t> writes_failed{0};
  std::atomic<uint64_t> evictions{0};
  std::atomic<uint64_t> cq_errors{0};
  std::atomic<uint64_t> registrations{0};

  // Not part of the stats. Region ids are never reused by a client, also
  // not across Shutdown and Initialize.
  std::atomic<uint64_t> next_region_id{1};

  ClientStats Snapshot() const {
    ClientStats s;
    s.pollers_started = pollers_started.load();
    s.handshakes = handshakes.load();
    s.writes_submitted = writes_submitted.load();
    s.writes_completed = writes_completed.load();
    s.writes_failed = writes_failed.load();
    s.evictions = evictions.load();
    s.cq_errors = cq_errors.load();
    s.registrations = registrations.load();
    return s;
  }
};

}

#endif // RDC_COUNTERS_HPP_
