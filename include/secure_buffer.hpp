#pragma once
#include <sodium.h>
#include <stdexcept>
#include <cstddef>
#include <cstring>
#include <string>

// Guarded heap block for the shared key and for keys read off the wire.
// Pinned in place: hand it around by reference or shared_ptr.
class SecureBuffer {
public:
    explicit SecureBuffer(size_t size) {
        allocate(size);
    }

    SecureBuffer(const void* src, size_t len) {
        allocate(len);
        if (len) std::memcpy(ptr_, src, len);
    }

    static SecureBuffer from_string(const std::string& s) {
        return SecureBuffer(s.data(), s.size());
    }

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    ~SecureBuffer() {
        if (!ptr_) return;
        sodium_mprotect_readwrite(ptr_);
        sodium_memzero(ptr_, capacity_);
        if (locked_) sodium_munlock(ptr_, capacity_);
        sodium_free(ptr_);
    }

    unsigned char* data() { return ptr_; }
    const unsigned char* data() const { return ptr_; }
    size_t size() const { return size_; }

    // Constant-time once the lengths agree
    bool equals(const unsigned char* other, size_t len) const {
        if (len != size_) return false;
        return len == 0 || sodium_memcmp(ptr_, other, len) == 0;
    }

    void protect_readonly() { sodium_mprotect_readonly(ptr_); }

private:
    void allocate(size_t size) {
        size_ = size;
        capacity_ = size ? size : 1;
        ptr_ = static_cast<unsigned char*>(sodium_malloc(capacity_));
        if (!ptr_) {
            throw std::runtime_error("SecureBuffer: sodium_malloc failed");
        }
        // RLIMIT_MEMLOCK is often tiny in containers, the guard pages remain
        locked_ = sodium_mlock(ptr_, capacity_) == 0;
        sodium_memzero(ptr_, capacity_);
    }

    unsigned char* ptr_ = nullptr;
    size_t size_ = 0;
    size_t capacity_ = 0;
    bool locked_ = false;
};
