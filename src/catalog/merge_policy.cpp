#include <govcat/catalog/merge_policy.h>

#include <algorithm>

namespace govcat::catalog::merge {

const Entry* pickPrimary(const std::vector<const Entry*>& group) {
    const Entry* primary = nullptr;
    for (const auto* e : group) {
        if (!e) {
            continue;
        }
        if (!primary || e->createdAt < primary->createdAt ||
            (e->createdAt == primary->createdAt && e->id < primary->id)) {
            primary = e;
        }
    }
    return primary;
}

std::vector<std::string> unionCategories(const std::vector<std::string>& a,
                                         const std::vector<std::string>& b) {
    std::vector<std::string> all(a);
    all.insert(all.end(), b.begin(), b.end());
    return normalizeCategories(all);
}

std::optional<int> maxRiskScore(const std::optional<int>& a, const std::optional<int>& b) {
    if (!a) return b;
    if (!b) return a;
    return std::max(*a, *b);
}

int lowestPriority(int a, int b) {
    return std::min(a, b);
}

bool foldDuplicate(Entry& primary, const Entry& duplicate) {
    bool changed = false;
    if (int p = lowestPriority(primary.priority, duplicate.priority); p != primary.priority) {
        primary.priority = p;
        changed = true;
    }
    if (auto r = maxRiskScore(primary.riskScore, duplicate.riskScore); r != primary.riskScore) {
        primary.riskScore = r;
        changed = true;
    }
    if (auto cats = unionCategories(primary.categories, duplicate.categories);
        cats != primary.categories) {
        primary.categories = std::move(cats);
        changed = true;
    }
    return changed;
}

} // namespace govcat::catalog::merge
