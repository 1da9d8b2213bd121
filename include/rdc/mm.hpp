/*
 *
 *  mm.hpp
 *
 *  Buffer views and registered memory regions
 *
 */

#ifndef RDC_MM_HPP_
#define RDC_MM_HPP_

#include <stddef.h>

#include <cstdint>

namespace rdc {
namespace memory {

/*
 * Borrowed, read-only view of caller owned memory. The caller keeps the
 * memory alive and unmodified until every write referencing it completed.
 */
class ConstBuffer {
  public:
    ConstBuffer() : data_(nullptr), capacity_(0) {}
    ConstBuffer(const void *data, size_t capacity) : data_(data), capacity_(capacity) {}

    const void *data() const { return data_; }
    size_t capacity() const { return capacity_; }
    bool empty() const { return data_ == nullptr || capacity_ == 0; }

    uint64_t address() const { return (uint64_t)(uintptr_t)data_; }

    // Whether [offset, offset+length) lies inside the view
    bool Contains(size_t offset, size_t length) const {
      return offset <= capacity_ && length <= capacity_ - offset;
    }

    // Returns the view of the first length bytes. Callers check Contains first.
    ConstBuffer Prefix(size_t length) const {
      return ConstBuffer(data_, length < capacity_ ? length : capacity_);
    }

  private:
    const void *data_;
    size_t capacity_;
};

/*
 * A span registered with the RDMA device. The registry owns the hardware
 * registration identified by id, the caller owns the memory at addr.
 */
struct Region {
  uint64_t    id;
  void *      addr;
  size_t      length;
  uint32_t    lkey;
  uint32_t    rkey;
};

inline bool RegionContains(const Region &region, const void *addr, size_t length) {
  uint64_t base = (uint64_t)(uintptr_t)region.addr;
  uint64_t start = (uint64_t)(uintptr_t)addr;
  return start >= base && start - base <= region.length && length <= region.length - (start - base);
}

}
}
#endif // RDC_MM_HPP_
