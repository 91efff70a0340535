#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace vl::types {

struct UserData;

// A file as handed to the orchestrator by the caller.
struct FileSource {
    std::filesystem::path path;
    std::string name;   // defaults to path.filename()
    std::string mime;   // guessed from the extension when empty
};

// Editable subset of FileData. Only fields that are set get applied.
struct FileSetting {
    std::optional<std::string> title, desc, tag;
    std::optional<int> cataid, luping, keepsource;
    std::optional<nlohmann::json> state;
};

struct FileData {
    std::string id;
    std::string title, desc, tag;
    int cataid = 1;
    int luping = 0;        // screen-recording optimisation, 0 or 1
    int keepsource = 0;    // skip re-encoding on the remote side, 0 or 1
    std::string filename, mime, vid;
    uint64_t size{};
    std::filesystem::path path;
    nlohmann::json state = nlohmann::json::object();

    void merge(const FileSetting& setting);
};

void to_json(nlohmann::json& j, const FileData& f);
void from_json(const nlohmann::json& j, FileData& f);

std::string cleanupTitle(const std::string& title);

// Builds the metadata record for source and assigns its fingerprint id.
FileData generateFileData(const FileSource& source, const FileSetting& setting, const UserData& user);

}
