// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_UTIL_SECURE_ALLOCATOR_H
#define CANARY_UTIL_SECURE_ALLOCATOR_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <utility>
#include <string>
#include <vector>

#include <sys/mman.h>

/**
 * Secure memory for PINs, wrapping keys and signing keys.
 *
 * Pages handed out by SecureAllocator are mlock()ed so they stay out of swap,
 * and are wiped before they are released. Locking is best effort: without
 * CAP_IPC_LOCK or a large enough RLIMIT_MEMLOCK the allocation still succeeds.
 */

/**
 * Overwrite a buffer with zeros in a way the optimizer cannot drop.
 */
inline void memory_cleanse(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) return;

    std::memset(ptr, 0, len);
    __asm__ __volatile__("" : : "r"(ptr) : "memory");
}

inline bool LockMemory(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) {
        return false;
    }
    return mlock(ptr, len) == 0;
}

inline bool UnlockMemory(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) {
        return false;
    }
    return munlock(ptr, len) == 0;
}

template <typename T>
class SecureAllocator {
public:
    typedef T value_type;
    typedef T* pointer;
    typedef const T* const_pointer;
    typedef size_t size_type;
    typedef ptrdiff_t difference_type;

    template <typename U>
    struct rebind {
        typedef SecureAllocator<U> other;
    };

    SecureAllocator() noexcept {}
    SecureAllocator(const SecureAllocator&) noexcept {}
    template <typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    pointer allocate(size_type n) {
        if (n > max_size()) {
            throw std::bad_alloc();
        }

        size_type bytes = n * sizeof(T);
        void* ptr = ::operator new(bytes);

        // Zero before locking so mlock never sees uninitialized pages
        std::memset(ptr, 0, bytes);
        LockMemory(ptr, bytes);

        return static_cast<pointer>(ptr);
    }

    void deallocate(pointer ptr, size_type n) noexcept {
        if (ptr == nullptr) {
            return;
        }

        size_type bytes = n * sizeof(T);
        memory_cleanse(ptr, bytes);
        UnlockMemory(ptr, bytes);
        ::operator delete(ptr);
    }

    size_type max_size() const noexcept {
        return std::numeric_limits<size_type>::max() / sizeof(T);
    }
};

template <typename T, typename U>
bool operator==(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept {
    return true;
}

template <typename T, typename U>
bool operator!=(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept {
    return false;
}

/** Byte buffer for key material. Wiped and unlocked on every reallocation and on destruction. */
typedef std::vector<uint8_t, SecureAllocator<uint8_t>> SecureBytes;

/**
 * String for PINs and pasted private keys.
 *
 * Backed by a vector, not std::basic_string: the small-string buffer would keep
 * a 6-digit PIN inside the object itself, where SecureAllocator never sees it.
 * Every character lives in allocator memory, and clear()/pop_back() wipe what
 * they drop.
 */
class SecureString
{
public:
    typedef std::vector<char, SecureAllocator<char>> Storage;
    typedef Storage::size_type size_type;
    typedef Storage::const_iterator const_iterator;

    SecureString() = default;
    explicit SecureString(const char* str) : SecureString(str, str ? std::strlen(str) : 0) {}
    SecureString(const char* str, size_type len) : m_data(str, str + len) {}

    SecureString(const SecureString&) = default;
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            clear();
            m_data = other.m_data;
        }
        return *this;
    }
    SecureString(SecureString&&) noexcept = default;
    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            clear();
            m_data = std::move(other.m_data);
        }
        return *this;
    }

    const char* data() const { return m_data.data(); }
    size_type size() const { return m_data.size(); }
    size_type capacity() const { return m_data.capacity(); }
    bool empty() const { return m_data.empty(); }

    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }
    char operator[](size_type i) const { return m_data[i]; }
    char back() const { return m_data.back(); }

    void reserve(size_type n) { m_data.reserve(n); }
    void push_back(char c) { m_data.push_back(c); }

    void pop_back() {
        memory_cleanse(&m_data.back(), 1);
        m_data.pop_back();
    }

    //! Wipes the whole buffer, including spare capacity, then empties it
    void clear() {
        memory_cleanse(m_data.data(), m_data.capacity());
        m_data.clear();
    }

    SecureString& operator+=(char c) {
        push_back(c);
        return *this;
    }
    SecureString& operator+=(const char* str) {
        if (str) m_data.insert(m_data.end(), str, str + std::strlen(str));
        return *this;
    }

    bool operator==(const SecureString& other) const { return m_data == other.m_data; }
    bool operator!=(const SecureString& other) const { return m_data != other.m_data; }

private:
    Storage m_data;
};

#endif // CANARY_UTIL_SECURE_ALLOCATOR_H
