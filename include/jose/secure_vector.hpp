/**
 * @file secure_vector.hpp
 * @brief Locked, zero-on-release storage for key material
 *
 * CEKs, KEKs, passwords, derived keys and ECDH shared secrets are held in
 * SecureVector so they are wiped when the owning operation ends.
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <span>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace jose {

/**
 * @brief Allocator that page-locks its blocks and zeroes them before release
 *
 * Locking is best effort; a failed mlock does not fail the allocation.
 */
template <typename T>
class SecureAllocator {
 public:
  using value_type = T;
  using size_type = std::size_t;

  template <typename U>
  struct rebind {
    using other = SecureAllocator<U>;
  };

  SecureAllocator() = default;

  template <typename U>
  SecureAllocator(const SecureAllocator<U>&) noexcept {}

  /**
   * @brief Allocate page-aligned storage and lock it in memory
   * @param n Number of elements
   * @throws std::bad_alloc if the allocation fails
   */
  T* allocate(size_t n) {
    if (n == 0) return nullptr;

    const size_t block = blockSize(n);
    T* ptr = static_cast<T*>(std::aligned_alloc(pageSize(), block));
    if (!ptr) throw std::bad_alloc();

#ifdef _WIN32
    VirtualLock(ptr, block);
#else
    mlock(ptr, block);
#endif
    return ptr;
  }

  void deallocate(T* ptr, size_t n) noexcept {
    if (!ptr) return;
    const size_t block = blockSize(n);
    wipe(ptr, block);
#ifdef _WIN32
    VirtualUnlock(ptr, block);
#else
    munlock(ptr, block);
#endif
    std::free(ptr);
  }

  template <typename U>
  bool operator==(const SecureAllocator<U>&) const noexcept {
    return true;
  }

  template <typename U>
  bool operator!=(const SecureAllocator<U>&) const noexcept {
    return false;
  }

  /**
   * @brief Zero a memory region through a volatile pointer so the store is
   * not elided
   */
  static void wipe(void* ptr, size_t size) noexcept {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    for (size_t i = 0; i < size; ++i) {
      p[i] = 0;
    }
  }

 private:
  static size_t pageSize() noexcept {
#ifdef _WIN32
    SYSTEM_INFO si;
    GetSystemInfo(&si);
    return si.dwPageSize;
#else
    return static_cast<size_t>(sysconf(_SC_PAGESIZE));
#endif
  }

  // aligned_alloc requires the size to be a multiple of the alignment
  static size_t blockSize(size_t n) noexcept {
    const size_t page = pageSize();
    return ((n * sizeof(T) + page - 1) / page) * page;
  }
};

template <typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/// Secret byte string: CEK, KEK, password, derived key
using SecretBytes = SecureVector<uint8_t>;

namespace secure_utils {

/**
 * @brief Compare two byte ranges in time independent of where they differ
 * @return true when sizes and contents match
 */
inline bool constantTimeEqual(std::span<const uint8_t> a,
                              std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  const volatile uint8_t* va = a.data();
  const volatile uint8_t* vb = b.data();
  uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= va[i] ^ vb[i];
  }
  return diff == 0;
}

inline SecretBytes toSecret(std::span<const uint8_t> bytes) {
  return SecretBytes(bytes.begin(), bytes.end());
}

inline SecretBytes toSecret(std::string_view text) {
  return SecretBytes(text.begin(), text.end());
}

inline std::vector<uint8_t> toPlain(std::span<const uint8_t> bytes) {
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

}  // namespace secure_utils

}  // namespace jose
