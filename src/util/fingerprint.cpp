#include "util/fingerprint.hpp"

#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <fmt/core.h>

namespace vl::util {

namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestCtx newMd5Context() {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        throw std::runtime_error("Failed to initialise MD5 digest");
    return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) throw std::runtime_error("Failed to finalise MD5 digest");

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return oss.str();
}

}

std::string md5Hex(const std::string& data) {
    const auto ctx = newMd5Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        throw std::runtime_error("Failed to update MD5 digest");
    return finish(ctx.get());
}

std::string md5FileHex(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error(fmt::format("Failed to open {} for hashing", path.string()));

    const auto ctx = newMd5Context();
    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1)
            throw std::runtime_error("Failed to update MD5 digest");
    }
    if (in.bad()) throw std::runtime_error(fmt::format("Read error while hashing {}", path.string()));

    return finish(ctx.get());
}

std::string fingerprint(const std::string& userid, const int cataid, const std::string& title,
                        const std::string& mime, const std::string& contentHash) {
    return md5Hex(fmt::format("vidlift-{}-{}-{}-{}-{}", userid, cataid, title, mime, contentHash));
}

}
