#pragma once

#include <filesystem>
#include <string>

namespace vl::util {

std::string md5Hex(const std::string& data);

// Streams the file through the digest; throws std::runtime_error if unreadable.
std::string md5FileHex(const std::filesystem::path& path);

// Deterministic id for a file: equal inputs always yield the same id.
std::string fingerprint(const std::string& userid, int cataid, const std::string& title,
                        const std::string& mime, const std::string& contentHash);

}
