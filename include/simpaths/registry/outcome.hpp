/**
 * @file outcome.hpp
 * @brief Tri-part result of a registry operation: payload-or-none, ok flag, message.
 *
 * Registry operations never throw for expected conditions (busy registry,
 * unknown path, missing artifact, malformed pattern). They return one of:
 *
 * - `Outcome<T>`: a payload on success, none on failure, plus a human-readable
 *   message in both cases.
 * - `Status`: ok flag and message, for operations without a payload.
 *
 * Usage:
 * @code
 * Outcome<std::vector<std::string>> r = registry.list_paths("alice");
 * if (!r.ok) {
 *     LOGGER_WARN("list failed: {}", r.message);
 *     return;
 * }
 * for (const auto &p : r.content()) { ... }
 * @endcode
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace simpaths::registry
{

struct Status
{
    bool ok = false;
    std::string message;

    [[nodiscard]] static Status success(std::string msg = {}) { return Status{true, std::move(msg)}; }
    [[nodiscard]] static Status failure(std::string msg) { return Status{false, std::move(msg)}; }
};

template <typename T> struct Outcome
{
    using value_type = T;

    std::optional<T> payload;
    bool ok = false;
    std::string message;

    [[nodiscard]] static Outcome success(T value, std::string msg = {})
    {
        Outcome r;
        r.payload = std::move(value);
        r.ok = true;
        r.message = std::move(msg);
        return r;
    }

    [[nodiscard]] static Outcome failure(std::string msg)
    {
        Outcome r;
        r.message = std::move(msg);
        return r;
    }

    /// Converts a failed outcome of another payload type, keeping its message.
    template <typename U> [[nodiscard]] static Outcome propagate(const Outcome<U> &other)
    {
        return failure(other.message);
    }

    /**
     * @throws std::logic_error if there is no payload. Check `ok` first.
     */
    [[nodiscard]] T &content() &
    {
        if (!payload)
            throw std::logic_error("Outcome::content() called on a failed outcome");
        return *payload;
    }

    [[nodiscard]] const T &content() const &
    {
        if (!payload)
            throw std::logic_error("Outcome::content() called on a failed outcome");
        return *payload;
    }

    [[nodiscard]] T &&content() &&
    {
        if (!payload)
            throw std::logic_error("Outcome::content() called on a failed outcome");
        return std::move(*payload);
    }

    [[nodiscard]] Status status() const { return Status{ok, message}; }
};

} // namespace simpaths::registry
