#include "slackpost/slack/resolver.hpp"

#include "slackpost/common/strings.hpp"

namespace slackpost::slack {

std::optional<CommunityKind> resolve_kind(const std::string &prefix) {
  for (const auto kind : kAllKinds) {
    if (common::starts_with(collection_key(kind), prefix)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<Community> find_by_name(const std::vector<Community> &communities,
                                      const std::string &name) {
  for (const auto &community : communities) {
    if (community.name == name) {
      return community;
    }
  }
  return std::nullopt;
}

ApiResult<std::vector<Community>> Resolver::list(const CommunityKind kind,
                                                 const std::string &token) const {
  using Out = ApiResult<std::vector<Community>>;
  auto records = client_.list_communities(kind, token);
  if (!records.ok()) {
    return Out::failure(records.error());
  }

  std::vector<Community> communities;
  communities.reserve(records.value().size());
  for (const auto &record : records.value()) {
    communities.push_back(Community::from_record(record, kind));
  }
  return Out::success(std::move(communities));
}

} // namespace slackpost::slack
