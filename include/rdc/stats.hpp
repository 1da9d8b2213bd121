/*
 *
 *  stats.hpp
 *
 *  Snapshot of client counters
 *
 */

#ifndef RDC_STATS_HPP_
#define RDC_STATS_HPP_

#include <cstdint>
#include <ostream>

namespace rdc {

struct ClientStats {
  uint64_t pollers_started;
  uint64_t handshakes;
  uint64_t writes_submitted;
  uint64_t writes_completed;
  uint64_t writes_failed;
  uint64_t evictions;
  uint64_t cq_errors;
  uint64_t registrations;
};

inline std::ostream& operator<<(std::ostream& os, ClientStats const& s) {
  return os << "pollers_started=" << s.pollers_started
    << " handshakes=" << s.handshakes
    << " writes_submitted=" << s.writes_submitted
    << " writes_completed=" << s.writes_completed
    << " writes_failed=" << s.writes_failed
    << " evictions=" << s.evictions
    << " cq_errors=" << s.cq_errors
    << " registrations=" << s.registrations;
}

}

#endif // RDC_STATS_HPP_
