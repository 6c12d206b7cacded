#pragma once

#include "rhythmlink/score/Score.hpp"

#include <optional>
#include <unordered_map>
#include <variant>

namespace rhythmlink::rhythm {

/// Cross-page slur links: slur beginning the current page -> slur ending the previous page.
using CrossSlurLinks = std::unordered_map<int, int>;

/// Across measures of one system, the partnering slur is the slur itself.
struct SystemLocalSlurAdapter {};

/// Across systems of one page, the partnering slur is the left extension.
struct PageLocalSlurAdapter {};

/// Across pages of one score, the partnering slur comes from the cross-page links.
struct ScoreLocalSlurAdapter {
    const CrossSlurLinks& links;
};

using SlurAdapter = std::variant<SystemLocalSlurAdapter, PageLocalSlurAdapter, ScoreLocalSlurAdapter>;

/// Report the initial (preceding) partner of the slur, or nullopt when it has none.
std::optional<int> partnerOf(const score::Score& score, const SlurAdapter& adapter, int slurIndex);

}  // namespace rhythmlink::rhythm
