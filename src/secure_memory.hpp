// File: secure_memory.hpp
// Brief: Locked, self-wiping storage for secret key material
//
// SecureMemory owns a heap buffer that:
// - is locked so the pages are not swapped to disk
// - is wiped with OPENSSL_cleanse before it is released
// - can be moved but never copied

#pragma once

#include <span>
#include <cstdint>
#include <cstring>
#include <openssl/crypto.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace minawallet {

class SecureMemory {
private:
    uint8_t* data_;
    size_t size_;

    void release() noexcept {
        if (data_) {
            OPENSSL_cleanse(data_, size_);
            #ifdef _WIN32
            VirtualUnlock(data_, size_);
            #else
            munlock(data_, size_);
            #endif
            delete[] data_;
            data_ = nullptr;
            size_ = 0;
        }
    }

public:
    explicit SecureMemory(std::span<const uint8_t> input)
        : data_(new uint8_t[input.size()])
        , size_(input.size())
    {
        std::memcpy(data_, input.data(), size_);

        // Locking is best effort: without CAP_IPC_LOCK or with a low
        // RLIMIT_MEMLOCK the buffer stays usable, only swappable.
        #ifdef _WIN32
        VirtualLock(data_, size_);
        #else
        mlock(data_, size_);
        #endif
    }

    ~SecureMemory() {
        release();
    }

    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept : data_(other.data_), size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    std::span<const uint8_t> span() const { return {data_, size_}; }
};

} // namespace minawallet
