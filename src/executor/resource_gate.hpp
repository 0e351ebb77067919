/**
 * @file resource_gate.hpp
 * @brief Host memory budget shared by concurrent sandbox invocations.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace code_sandbox {

/**
 * @brief Counting budget of memory bytes.
 *
 * Every sandbox invocation reserves its policy's memory cap before it
 * starts and returns it when the Reservation is destroyed. A request larger
 * than the whole budget is clamped to the budget so it can still run alone.
 */
class ResourceGate {
public:
    class Reservation {
    public:
        Reservation() = default;
        Reservation(ResourceGate* gate, uint64_t bytes) : gate_(gate), bytes_(bytes) {}
        ~Reservation() { release(); }

        Reservation(Reservation&& other) noexcept
            : gate_(other.gate_), bytes_(other.bytes_) {
            other.gate_ = nullptr;
            other.bytes_ = 0;
        }

        Reservation& operator=(Reservation&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = other.gate_;
                bytes_ = other.bytes_;
                other.gate_ = nullptr;
                other.bytes_ = 0;
            }
            return *this;
        }

        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        [[nodiscard]] uint64_t bytes() const noexcept { return bytes_; }

        void release() noexcept {
            if (gate_) gate_->give_back(bytes_);
            gate_ = nullptr;
            bytes_ = 0;
        }

    private:
        ResourceGate* gate_ = nullptr;
        uint64_t bytes_ = 0;
    };

    explicit ResourceGate(uint64_t capacity_bytes);

    /// Block until `bytes` (clamped to capacity) are available.
    [[nodiscard]] Reservation reserve(uint64_t bytes);

    /// Non-blocking variant; returns an empty Reservation when the budget is exhausted.
    [[nodiscard]] Reservation try_reserve(uint64_t bytes);

    [[nodiscard]] uint64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint64_t in_use() const noexcept;

    /// Half of physical memory, or 1 GiB when it cannot be determined.
    [[nodiscard]] static uint64_t default_capacity() noexcept;

private:
    void give_back(uint64_t bytes) noexcept;

    const uint64_t capacity_;
    uint64_t in_use_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace code_sandbox
