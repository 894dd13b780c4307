#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string_view>

namespace datamesh {

// Per-key lock pool. Serializes work on the same key without a global lock;
// distinct keys that hash to the same slot share a mutex.
// N must be a power of two for efficient index masking.
template <std::size_t N = 64, typename MutexType = std::recursive_timed_mutex>
class LockPool final {
    static_assert(N > 0 && (N & (N - 1)) == 0, "Pool size must be a power of two");

    std::array<MutexType, N> mutexes_{};

public:
    constexpr LockPool() noexcept = default;

    LockPool(const LockPool&) = delete;
    LockPool& operator=(const LockPool&) = delete;

    [[nodiscard]] static std::size_t index(std::string_view key) noexcept {
        return std::hash<std::string_view>{}(key) & (N - 1);
    }

    [[nodiscard]] MutexType& get(std::string_view key) noexcept { return mutexes_[index(key)]; }

    [[nodiscard]] std::unique_lock<MutexType> lock(std::string_view key) {
        return std::unique_lock<MutexType>{get(key)};
    }

    // Check owns_lock() on the returned guard.
    template <typename Rep, typename Period>
    [[nodiscard]] std::unique_lock<MutexType> try_lock_for(std::string_view key,
                                                           std::chrono::duration<Rep, Period> timeout) {
        return std::unique_lock<MutexType>{get(key), timeout};
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept { return N; }
};

} // namespace datamesh
