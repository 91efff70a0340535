#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace vl::types {

// Account credentials used to open upload sessions. Signatures are short-lived,
// so callers refresh them periodically through merge().
struct UserData {
    std::string userid, sign, hash, appId, region;
    uint64_t ptime{}, timestamp{};

    // Copies every non-empty field of other into this object in place.
    void merge(const UserData& other);

    [[nodiscard]] bool isSubAccount() const { return !appId.empty(); }
};

void to_json(nlohmann::json& j, const UserData& u);
void from_json(const nlohmann::json& j, UserData& u);

}
