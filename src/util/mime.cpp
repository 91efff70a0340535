#include "util/mime.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace vl::util {

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

std::string mimeFromPath(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> types = {
        {".mp4", "video/mp4"},
        {".m4v", "video/x-m4v"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".wmv", "video/x-ms-wmv"},
        {".flv", "video/x-flv"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".mpg", "video/mpeg"},
        {".mpeg", "video/mpeg"},
        {".3gp", "video/3gpp"},
        {".ts", "video/mp2t"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"}
    };

    const auto ext = lower(std::filesystem::path(filename).extension().string());
    if (const auto it = types.find(ext); it != types.end()) return it->second;
    return "application/octet-stream";
}

bool isAcceptedMimeType(const std::string& mime, const std::vector<std::string>& accepted) {
    if (accepted.empty()) return true;

    const auto type = lower(mime);
    const auto major = type.substr(0, type.find('/'));

    return std::ranges::any_of(accepted, [&](const std::string& entry) {
        const auto e = lower(entry);
        if (e == "*/*" || e == type) return true;
        return e.size() > 2 && e.ends_with("/*") && e.substr(0, e.size() - 2) == major;
    });
}

}
