#include "utils/curve_keys.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <zmq.h>

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace pubhub::crypto
{

namespace fs = std::filesystem;

namespace
{

constexpr size_t kZ85BufLen = kCurveKeyZ85Length + 1;

/// Value of a `name = "value"` line, or nullopt for comments and other lines.
std::optional<std::pair<std::string, std::string>> parse_zpl_property(std::string_view line)
{
    line = format_tools::trim_whitespace(line);
    if (line.empty() || line.front() == '#')
    {
        return std::nullopt;
    }
    const auto eq = line.find('=');
    if (eq == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto name = format_tools::trim_whitespace(line.substr(0, eq));
    auto value = format_tools::trim_whitespace(line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front())
    {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(std::string(name), std::string(value));
}

void write_certificate(const fs::path &path, const std::string &public_key,
                       const std::string *secret_key)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error(
            fmt::format("CurveKeys: cannot open '{}' for writing", path.string()));
    }
    out << "#   ****  Generated by pubhub  ****\n";
    if (secret_key != nullptr)
    {
        out << "#   ZeroMQ CURVE **Secret** Certificate\n"
               "#   DO NOT PROVIDE THIS FILE TO OTHER USERS nor change its permissions.\n";
    }
    else
    {
        out << "#   ZeroMQ CURVE Public Certificate\n"
               "#   Exchange securely, or use a secure mechanism to verify the contents\n"
               "#   of this file after exchange.\n";
    }
    out << "\nmetadata\ncurve\n";
    out << "    public-key = \"" << public_key << "\"\n";
    if (secret_key != nullptr)
    {
        out << "    secret-key = \"" << *secret_key << "\"\n";
    }
    out.close();
    if (!out)
    {
        throw std::runtime_error(fmt::format("CurveKeys: failed writing '{}'", path.string()));
    }
}

} // anonymous namespace

std::string z85_encode_key(const CurveKeyBytes &key)
{
    std::array<char, kZ85BufLen> buf{};
    if (zmq_z85_encode(buf.data(), key.data(), key.size()) == nullptr)
    {
        throw std::runtime_error("CurveKeys: zmq_z85_encode failed");
    }
    return std::string(buf.data(), kCurveKeyZ85Length);
}

CurveKeyBytes z85_decode_key(std::string_view text)
{
    if (text.size() != kCurveKeyZ85Length)
    {
        throw std::invalid_argument(fmt::format(
            "CurveKeys: Z85 key must be {} characters, got {}", kCurveKeyZ85Length, text.size()));
    }
    const std::string terminated(text);
    CurveKeyBytes key{};
    if (zmq_z85_decode(key.data(), terminated.c_str()) == nullptr)
    {
        throw std::invalid_argument("CurveKeys: key is not valid Z85");
    }
    return key;
}

CurveKeyPair load_certificate(const fs::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error(
            fmt::format("CurveKeys: cannot read certificate '{}'", path.string()));
    }

    CurveKeyPair pair;
    std::string line;
    while (std::getline(in, line))
    {
        auto prop = parse_zpl_property(line);
        if (!prop)
            continue;
        if (prop->first == "public-key")
            pair.public_key = std::move(prop->second);
        else if (prop->first == "secret-key")
            pair.secret_key = std::move(prop->second);
    }

    if (pair.public_key.empty())
    {
        throw std::runtime_error(
            fmt::format("CurveKeys: no public-key in certificate '{}'", path.string()));
    }
    try
    {
        static_cast<void>(z85_decode_key(pair.public_key));
        if (pair.secret_key)
        {
            static_cast<void>(z85_decode_key(*pair.secret_key));
        }
    }
    catch (const std::invalid_argument &e)
    {
        throw std::runtime_error(
            fmt::format("CurveKeys: malformed key in '{}': {}", path.string(), e.what()));
    }
    return pair;
}

std::set<std::string> load_certificates(const fs::path &directory)
{
    std::error_code ec;
    if (!fs::is_directory(directory, ec))
    {
        throw std::runtime_error(
            fmt::format("CurveKeys: '{}' is not a directory", directory.string()));
    }

    std::set<std::string> keys;
    for (const auto &entry : fs::directory_iterator(directory))
    {
        if (!entry.is_regular_file() || entry.path().extension() != ".key")
        {
            continue;
        }
        keys.insert(load_certificate(entry.path()).public_key);
    }
    LOGGER_DEBUG("CurveKeys: loaded {} public key(s) from '{}'.", keys.size(), directory.string());
    return keys;
}

std::pair<fs::path, fs::path> generate_certificate(const fs::path &directory,
                                                   const std::string &name)
{
    std::array<char, kZ85BufLen> public_key{};
    std::array<char, kZ85BufLen> secret_key{};
    if (zmq_curve_keypair(public_key.data(), secret_key.data()) != 0)
    {
        throw std::runtime_error(
            fmt::format("CurveKeys: zmq_curve_keypair failed: {}", zmq_strerror(zmq_errno())));
    }
    const std::string pub(public_key.data(), kCurveKeyZ85Length);
    const std::string sec(secret_key.data(), kCurveKeyZ85Length);

    fs::create_directories(directory);
    const fs::path public_path = directory / (name + ".key");
    const fs::path secret_path = directory / (name + ".key_secret");
    write_certificate(public_path, pub, nullptr);
    write_certificate(secret_path, pub, &sec);
    fs::permissions(secret_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
    return {public_path, secret_path};
}

} // namespace pubhub::crypto
