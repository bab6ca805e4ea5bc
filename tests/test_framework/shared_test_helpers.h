// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines PUBHUB_IS_POSIX before any platform-conditional includes.
#include "phb_platform.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for the pubhub test executables: file I/O, scratch
 *        directories, environment overrides and port discovery.
 */

namespace pubhub::tests::helper
{

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of @p text, optionally only those containing
 *        @p must_include and not containing @p must_exclude.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls @p path until it contains @p expected or @p timeout expires.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @brief Returns the test scale from `PUBHUB_TEST_SCALE` ("small" in CI).
 */
std::string test_scale();

/// `small_value` when the test scale is "small", otherwise `original`.
int scaled_value(int original, int small_value);

/**
 * @brief Scratch directory removed (recursively) on destruction.
 */
class TempDir
{
  public:
    explicit TempDir(std::string_view prefix = "pubhub_test");
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] const fs::path &path() const noexcept { return path_; }

  private:
    fs::path path_;
};

/**
 * @brief Sets (or unsets, with std::nullopt) an environment variable and
 *        restores the previous value on destruction.
 */
class ScopedEnv
{
  public:
    ScopedEnv(std::string name, std::optional<std::string> value);
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string name_;
    std::optional<std::string> previous_;
};

/**
 * @brief A TCP port on 127.0.0.1 that was free a moment ago.
 *
 * Bound and released through the OS; a racing process could still take it.
 */
int find_free_tcp_port();

} // namespace pubhub::tests::helper
