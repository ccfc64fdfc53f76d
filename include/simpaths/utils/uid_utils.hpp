#pragma once
/**
 * @file uid_utils.hpp
 * @brief Tokens that make pending-record file names unique.
 *
 * ## Token format
 *
 *   {16HEX}  -- 16 uppercase hex digits from a 64-bit value.
 *
 * The value mixes two 32-bit draws from std::random_device with a
 * process-wide counter, so two tokens generated back to back in one process
 * never repeat even when random_device reports zero entropy and the
 * clock-based fallback is used.
 *
 * Examples:
 *   "alice" + token -> alice-3A7F2B1C9E1D4C2A-pending.json
 */

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <string_view>

namespace simpaths::uid
{

inline constexpr std::size_t kTokenLength = 16;

namespace detail
{

/// Returns a 32-bit random value.
/// Prefers std::random_device; falls back to a high-res-clock+Knuth hash on failure.
inline uint32_t random_u32()
{
    try
    {
        std::random_device rd;
        if (rd.entropy() > 0.0)
        {
            return rd();
        }
    }
    catch (const std::exception &)
    {
    }
    const auto ns = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    return static_cast<uint32_t>((ns ^ (ns >> 17U)) * 2654435761ULL);
}

inline uint64_t next_sequence() noexcept
{
    static std::atomic<uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/**
 * @brief Generate a pending-record token: 16 uppercase hex digits.
 */
inline std::string generate_pending_token()
{
    uint64_t value = (static_cast<uint64_t>(detail::random_u32()) << 32U) | detail::random_u32();
    // splitmix64 step over the sequence number keeps same-process tokens distinct.
    uint64_t seq = detail::next_sequence() + 0x9E3779B97F4A7C15ULL;
    seq = (seq ^ (seq >> 30U)) * 0xBF58476D1CE4E5B9ULL;
    seq = (seq ^ (seq >> 27U)) * 0x94D049BB133111EBULL;
    value ^= seq ^ (seq >> 31U);

    char buf[kTokenLength + 1];
    std::snprintf(buf, sizeof(buf), "%016llX", static_cast<unsigned long long>(value));
    return std::string(buf, kTokenLength);
}

/// True if @p token is exactly 16 hex digits.
inline bool is_pending_token(std::string_view token) noexcept
{
    if (token.size() != kTokenLength)
        return false;
    for (unsigned char c : token)
    {
        if (std::isxdigit(c) == 0)
            return false;
    }
    return true;
}

} // namespace simpaths::uid
