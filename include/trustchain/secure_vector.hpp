/**
 * @file secure_vector.hpp
 * @brief Locked, zero-on-free storage for private key material
 */

#pragma once

#include <sys/mman.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <vector>

namespace trustchain {

/**
 * @brief Allocator for key bytes
 *
 * Pages are mlock'ed (best effort) so keys do not reach swap, and are
 * zeroed through a volatile pointer before being released.
 */
template <typename T>
class SecureAllocator {
 public:
  using value_type = T;

  SecureAllocator() = default;

  template <typename U>
  SecureAllocator(const SecureAllocator<U>&) noexcept {}

  T* allocate(size_t n) {
    if (n == 0) return nullptr;

    size_t page_size = static_cast<size_t>(sysconf(_SC_PAGESIZE));
    size_t size = n * sizeof(T);
    size_t aligned_size = ((size + page_size - 1) / page_size) * page_size;

    T* ptr = static_cast<T*>(std::aligned_alloc(page_size, aligned_size));
    if (!ptr) throw std::bad_alloc();

    mlock(ptr, aligned_size);
    return ptr;
  }

  void deallocate(T* ptr, size_t n) noexcept {
    if (!ptr) return;
    size_t size = n * sizeof(T);
    volatile unsigned char* p = reinterpret_cast<volatile unsigned char*>(ptr);
    for (size_t i = 0; i < size; ++i) {
      p[i] = 0;
    }
    munlock(ptr, size);
    std::free(ptr);
  }

  template <typename U>
  bool operator==(const SecureAllocator<U>&) const noexcept {
    return true;
  }
};

template <typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

namespace secure_utils {

/**
 * @brief Constant-time equality for MAC and signature comparison
 */
inline bool constantTimeEqual(std::span<const uint8_t> a,
                              std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  const volatile uint8_t* va = a.data();
  const volatile uint8_t* vb = b.data();
  uint8_t result = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    result |= va[i] ^ vb[i];
  }
  return result == 0;
}

template <typename T>
SecureVector<T> to_secure_vector(const std::vector<T>& regular_vec) {
  return SecureVector<T>(regular_vec.begin(), regular_vec.end());
}

}  // namespace secure_utils

}  // namespace trustchain
