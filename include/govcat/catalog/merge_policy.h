#pragma once

#include <optional>
#include <string>
#include <vector>
#include <govcat/catalog/entry.h>

namespace govcat::catalog::merge {

// Earliest createdAt wins; equal timestamps fall back to the smallest id
const Entry* pickPrimary(const std::vector<const Entry*>& group);

std::vector<std::string> unionCategories(const std::vector<std::string>& a,
                                         const std::vector<std::string>& b);

std::optional<int> maxRiskScore(const std::optional<int>& a, const std::optional<int>& b);

int lowestPriority(int a, int b);

// Fold one duplicate's metadata into the primary. Returns true when the primary changed.
bool foldDuplicate(Entry& primary, const Entry& duplicate);

} // namespace govcat::catalog::merge
