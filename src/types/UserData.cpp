#include "types/UserData.hpp"

#include <nlohmann/json.hpp>

using namespace vl::types;

void UserData::merge(const UserData& other) {
    if (!other.userid.empty()) userid = other.userid;
    if (!other.sign.empty()) sign = other.sign;
    if (!other.hash.empty()) hash = other.hash;
    if (!other.appId.empty()) appId = other.appId;
    if (!other.region.empty()) region = other.region;
    if (other.ptime) ptime = other.ptime;
    if (other.timestamp) timestamp = other.timestamp;
}

void vl::types::to_json(nlohmann::json& j, const UserData& u) {
    j = {
        {"userid", u.userid},
        {"ptime", u.ptime},
        {"hash", u.hash},
        {"appId", u.appId},
        {"timestamp", u.timestamp},
        {"region", u.region}
    };
    // sign is never serialised
}

void vl::types::from_json(const nlohmann::json& j, UserData& u) {
    u.userid = j.value("userid", std::string{});
    u.sign = j.value("sign", std::string{});
    u.hash = j.value("hash", std::string{});
    u.appId = j.value("appId", std::string{});
    u.region = j.value("region", std::string{});
    u.ptime = j.value("ptime", uint64_t{0});
    u.timestamp = j.value("timestamp", uint64_t{0});
}
