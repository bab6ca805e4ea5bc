#pragma once
/**
 * @file curve_keys.hpp
 * @brief CURVE key encoding and certificate files.
 *
 * Certificates are the ZPL text files written by the ZeroMQ tooling:
 * @code
 *   #   ZeroMQ CURVE Public Certificate
 *   metadata
 *   curve
 *       public-key = "rq:rM>}U?@Lns47E1%kR.o@n%FcmmsL/@{H8]yf7"
 * @endcode
 * A secret certificate (`*.key_secret`) additionally carries `secret-key`.
 * Keys are kept in their 40-character Z85 form.
 */
#include "pubhub_utils_export.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace pubhub::crypto
{

inline constexpr size_t kCurveKeyBytes = 32;
inline constexpr size_t kCurveKeyZ85Length = 40;

using CurveKeyBytes = std::array<uint8_t, kCurveKeyBytes>;

struct CurveKeyPair
{
    std::string public_key;
    std::optional<std::string> secret_key;
};

/// Z85 text of a raw 32-byte key.
[[nodiscard]] PUBHUB_UTILS_EXPORT std::string z85_encode_key(const CurveKeyBytes &key);

/**
 * @brief Raw bytes of a Z85-encoded key.
 * @throws std::invalid_argument if @p text is not 40 valid Z85 characters.
 */
[[nodiscard]] PUBHUB_UTILS_EXPORT CurveKeyBytes z85_decode_key(std::string_view text);

/**
 * @brief Reads the keypair stored in a certificate file.
 * @throws std::runtime_error if the file cannot be read, has no public key,
 *         or holds a key that is not valid Z85.
 */
[[nodiscard]] PUBHUB_UTILS_EXPORT CurveKeyPair
load_certificate(const std::filesystem::path &path);

/**
 * @brief Public keys of every `*.key` file in @p directory.
 * @throws std::runtime_error if @p directory is not a directory or a
 *         certificate in it is malformed.
 */
[[nodiscard]] PUBHUB_UTILS_EXPORT std::set<std::string>
load_certificates(const std::filesystem::path &directory);

/**
 * @brief Creates a new keypair and writes `<name>.key` and `<name>.key_secret`
 *        into @p directory (the secret file is made owner-readable only).
 * @return Paths of the public and secret certificate.
 * @throws std::runtime_error if libzmq lacks CURVE support or writing fails.
 */
PUBHUB_UTILS_EXPORT std::pair<std::filesystem::path, std::filesystem::path>
generate_certificate(const std::filesystem::path &directory, const std::string &name);

} // namespace pubhub::crypto
