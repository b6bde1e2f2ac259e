#pragma once

#include "slackpost/slack/api_client.hpp"
#include "slackpost/slack/community.hpp"

#include <optional>
#include <string>
#include <vector>

namespace slackpost::slack {

/// First kind (in kAllKinds order) whose collection key starts with prefix.
/// An empty prefix matches every key and therefore resolves to Channel.
[[nodiscard]] std::optional<CommunityKind> resolve_kind(const std::string &prefix);

/// First community, in list order, whose name equals name exactly.
[[nodiscard]] std::optional<Community> find_by_name(const std::vector<Community> &communities,
                                                    const std::string &name);

class Resolver {
public:
  explicit Resolver(const ApiClient &client) : client_(client) {}

  [[nodiscard]] ApiResult<std::vector<Community>> list(CommunityKind kind,
                                                       const std::string &token) const;

private:
  const ApiClient &client_;
};

} // namespace slackpost::slack
