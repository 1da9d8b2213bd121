/*
 *
 *  memory_registry.hpp
 *
 *  Tracks caller buffers registered with the RDMA device
 *
 */

#ifndef RDC_MEMORY_REGISTRY_HPP_
#define RDC_MEMORY_REGISTRY_HPP_

#include <stddef.h>

#include <cstdint>
#include <map>
#include <mutex>

#include "rdc/error.hpp"
#include "rdc/mm.hpp"
#include "rdc/options.hpp"
#include "rdc/transport.hpp"

#include "counters.hpp"

namespace rdc {
namespace memory {

/*
 * Registrations never overlap. Each one has a scope count (explicit Register
 * calls not yet matched by Deregister) and a pin count (outstanding writes).
 * The hardware registration is released once both drop to zero.
 *
 * The registry wraps caller memory, it never allocates or frees it.
 */
class Registry {
  public:
    Registry(transport::Device *device, RegistrationPolicy policy, Counters *counters)
      : device_(device), policy_(policy), counters_(counters) {};
    ~Registry() = default;

    // Registers buffer for the caller. Repeated registrations follow the policy.
    StatusOr<Region> Register(ConstBuffer buffer);

    // Returns the registration covering buffer, registering it without a
    // scope if there is none. Such registrations go away with their last pin.
    // The result is pinned once on behalf of the caller, who must Release it.
    // A buffer starting inside a registration but running past its end is
    // kInvalidArgument.
    StatusOr<Region> RegisterTransient(ConstBuffer buffer);

    // Drops one scope of region. Fails with kRegionInUse while writes reference
    // it and with kRegistrationRequired if region does not describe a live
    // registration.
    Status Deregister(const Region &region);

    // Returns the registration covering buffer or kRegistrationRequired.
    // kInvalidArgument if buffer runs past the end of the registration it starts in.
    StatusOr<Region> Find(ConstBuffer buffer);

    // Pins the registration of region for an outstanding write
    Status Acquire(const Region &region);
    void Release(uint64_t id);

    // Releases all hardware registrations regardless of scopes and pins
    Status DeregisterAll();

    size_t Size();
    uint32_t Pins(uint64_t id);

  private:
    struct Entry {
      Region region;
      uint64_t handle;
      uint32_t scopes;
      uint32_t pins;
    };

    enum class Overlap {
      kNone,
      kPartial,  // the span reaches into a registration from outside
      kPastEnd,  // the span starts inside a registration and runs past its end
    };

    // Locates the entry covering [start, start+length). Returns the end iterator if
    // there is none and sets *overlap to how the span meets other registrations.
    std::map<uint64_t, Entry>::iterator Lookup(uint64_t start, size_t length, Overlap *overlap);
    // Finds the entry region refers to, or the end iterator if region is stale
    std::map<uint64_t, Entry>::iterator Resolve(const Region &region);
    StatusOr<Region> Create(ConstBuffer buffer, uint32_t scopes, uint32_t pins);
    Status Remove(std::map<uint64_t, Entry>::iterator it);

    transport::Device *device_;
    RegistrationPolicy policy_;
    Counters *counters_;

    std::mutex mu_;
    // keyed by start address
    std::map<uint64_t, Entry> entries_;
    std::map<uint64_t, uint64_t> by_id_;
};

}
}

#endif // RDC_MEMORY_REGISTRY_HPP_
