#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace krep::commands {

// Splits a comma list, trimming blanks around each item. Empty input gives a
// single empty item so that an unset `group` key still forms a group list.
std::vector<std::string> SplitGroupList(std::string_view text);

// Group selection used by `batch -u`.
//
// `limits` are the requested groups, `-x` excluding group `x`. The first limit
// found in `groups` decides. Otherwise a project is selected when the limits
// hold `default` (or only exclusions) and the project is not marked
// `notdefault`.
bool InGroups(const std::vector<std::string>& limits, const std::vector<std::string>& groups);

} // namespace krep::commands
