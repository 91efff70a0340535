#pragma once

#include <string>
#include <vector>

namespace vl::util {

std::string mimeFromPath(const std::string& filename);

// An empty accepted list accepts everything. Entries are either exact types
// ("video/mp4") or a major type with a wildcard ("video/*").
bool isAcceptedMimeType(const std::string& mime, const std::vector<std::string>& accepted);

}
