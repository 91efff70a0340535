#include "types/FileData.hpp"
#include "types/UserData.hpp"
#include "util/fingerprint.hpp"
#include "util/mime.hpp"

#include <regex>
#include <fmt/core.h>

using namespace vl::types;

void FileData::merge(const FileSetting& setting) {
    if (setting.title) title = cleanupTitle(*setting.title);
    if (setting.desc) desc = *setting.desc;
    if (setting.tag) tag = *setting.tag;
    if (setting.cataid) cataid = *setting.cataid;
    if (setting.luping) luping = *setting.luping ? 1 : 0;
    if (setting.keepsource) keepsource = *setting.keepsource ? 1 : 0;
    if (setting.state) state = *setting.state;
}

void vl::types::to_json(nlohmann::json& j, const FileData& f) {
    j = {
        {"id", f.id},
        {"title", f.title},
        {"desc", f.desc},
        {"tag", f.tag},
        {"cataid", f.cataid},
        {"luping", f.luping},
        {"keepsource", f.keepsource},
        {"filename", f.filename},
        {"mime", f.mime},
        {"vid", f.vid},
        {"size", f.size},
        {"path", f.path.string()},
        {"state", f.state}
    };
}

void vl::types::from_json(const nlohmann::json& j, FileData& f) {
    f.id = j.at("id").get<std::string>();
    f.title = j.value("title", std::string{});
    f.desc = j.value("desc", std::string{});
    f.tag = j.value("tag", std::string{});
    f.cataid = j.value("cataid", 1);
    f.luping = j.value("luping", 0);
    f.keepsource = j.value("keepsource", 0);
    f.filename = j.value("filename", std::string{});
    f.mime = j.value("mime", std::string{});
    f.vid = j.value("vid", std::string{});
    f.size = j.value("size", uint64_t{0});
    f.path = j.value("path", std::string{});
    f.state = j.value("state", nlohmann::json::object());
}

std::string vl::types::cleanupTitle(const std::string& title) {
    static const std::regex tags("<.+?>");
    static const std::regex edges(R"(^\s+|\s+$)");
    return std::regex_replace(std::regex_replace(title, edges, ""), tags, "");
}

FileData vl::types::generateFileData(const FileSource& source, const FileSetting& setting, const UserData& user) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto size = fs::file_size(source.path, ec);
    if (ec) throw std::runtime_error(fmt::format("Unable to stat {}: {}", source.path.string(), ec.message()));

    FileData data;
    data.path = source.path;
    data.filename = source.name.empty() ? source.path.filename().string() : source.name;
    data.title = cleanupTitle(data.filename);
    data.mime = source.mime.empty() ? util::mimeFromPath(data.filename) : source.mime;
    data.size = size;
    data.merge(setting);

    data.id = util::fingerprint(user.userid, data.cataid, data.title, data.mime, util::md5FileHex(data.path));
    return data;
}
