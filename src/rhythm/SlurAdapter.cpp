#include "rhythmlink/rhythm/SlurAdapter.hpp"

namespace rhythmlink::rhythm {
namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

}  // namespace

std::optional<int> partnerOf(const score::Score& score, const SlurAdapter& adapter, int slurIndex) {
    if (score.slur(slurIndex) == nullptr) {
        return std::nullopt;
    }

    return std::visit(overloaded{
                          [&](const SystemLocalSlurAdapter&) -> std::optional<int> { return slurIndex; },
                          [&](const PageLocalSlurAdapter&) -> std::optional<int> {
                              const int extension = score.slurExtension(slurIndex, score::HorizontalSide::Left);
                              if (extension < 0) {
                                  return std::nullopt;
                              }
                              return extension;
                          },
                          [&](const ScoreLocalSlurAdapter& pageAdapter) -> std::optional<int> {
                              const auto it = pageAdapter.links.find(slurIndex);
                              if (it == pageAdapter.links.end()) {
                                  return std::nullopt;
                              }
                              return it->second;
                          },
                      },
                      adapter);
}

}  // namespace rhythmlink::rhythm
