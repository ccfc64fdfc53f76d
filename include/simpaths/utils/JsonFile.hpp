/*******************************************************************************
 * @file JsonFile.hpp
 * @brief Crash-safe JSON file replacement and tolerant JSON file reading.
 *
 * Both functions are `noexcept` and report through an optional
 * `std::error_code*`; they never throw. Callers that need exclusion against
 * other writers hold a `FileLock` on the target around the call.
 ******************************************************************************/
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "simpaths/platform.hpp"

namespace simpaths::utils
{

/**
 * @brief Atomically replaces @p target with the serialized @p j.
 *
 * Order: ensure the parent directory, refuse a symlinked target, write a
 * `<target>.tmp.XXXXXX` sibling, fsync it, copy the mode of an existing
 * target, rename() it over the target, fsync the directory. Readers observe
 * either the old content or the new content, never a partial file. On any
 * failure the temporary file is removed and the old target is untouched.
 *
 * @param indent Indentation passed to `json::dump`; -1 writes a single line.
 * @return true on success. On failure @p ec (if non-null) holds the cause.
 */
SIMPATHS_EXPORT bool atomic_write_json(const std::filesystem::path &target, const nlohmann::json &j,
                                       std::error_code *ec = nullptr, int indent = 4) noexcept;

/**
 * @brief Reads and parses a JSON file.
 *
 * @return the parsed document, or std::nullopt with @p ec set to
 *         `no_such_file_or_directory` (absent), `illegal_byte_sequence`
 *         (unparseable; @p detail receives the parser message) or the OS
 *         error of the failed read.
 */
SIMPATHS_EXPORT std::optional<nlohmann::json> read_json_file(const std::filesystem::path &path,
                                                             std::error_code *ec = nullptr,
                                                             std::string *detail = nullptr) noexcept;

} // namespace simpaths::utils
