/**
 * @file resource_gate.cpp
 * @brief ResourceGate implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/resource_gate.hpp"

#include <algorithm>
#include <unistd.h>

namespace code_sandbox {

ResourceGate::ResourceGate(uint64_t capacity_bytes)
    : capacity_(std::max<uint64_t>(capacity_bytes, 1)) {}

ResourceGate::Reservation ResourceGate::reserve(uint64_t bytes) {
    bytes = std::min(bytes, capacity_);
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return in_use_ + bytes <= capacity_; });
    in_use_ += bytes;
    return Reservation{this, bytes};
}

ResourceGate::Reservation ResourceGate::try_reserve(uint64_t bytes) {
    bytes = std::min(bytes, capacity_);
    std::lock_guard lock(mutex_);
    if (in_use_ + bytes > capacity_) return Reservation{};
    in_use_ += bytes;
    return Reservation{this, bytes};
}

uint64_t ResourceGate::in_use() const noexcept {
    std::lock_guard lock(mutex_);
    return in_use_;
}

void ResourceGate::give_back(uint64_t bytes) noexcept {
    {
        std::lock_guard lock(mutex_);
        in_use_ -= std::min(bytes, in_use_);
    }
    cv_.notify_all();
}

uint64_t ResourceGate::default_capacity() noexcept {
    long pages = ::sysconf(_SC_PHYS_PAGES);
    long page_size = ::sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) return 1024ULL * 1024 * 1024;
    return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size) / 2;
}

}  // namespace code_sandbox
