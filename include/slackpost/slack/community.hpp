#pragma once

#include <array>
#include <string>
#include <string_view>

namespace slackpost::slack {

enum class CommunityKind {
  Channel,
  Group,
};

/// Declaration order is the prefix tie-break order used by resolve_kind.
inline constexpr std::array<CommunityKind, 2> kAllKinds = {CommunityKind::Channel,
                                                           CommunityKind::Group};

/// "channel" or "group".
[[nodiscard]] std::string_view kind_name(CommunityKind kind);

/// API collection key: kind name plus "s". Used both as the list endpoint
/// prefix and as the payload key holding the results.
[[nodiscard]] std::string collection_key(CommunityKind kind);

/// A destination a message can be posted to.
struct Community {
  std::string id;
  std::string name;
  CommunityKind kind = CommunityKind::Channel;

  /// "#general" for channels, "ops group" for groups.
  [[nodiscard]] std::string label() const;

  /// Build from one JSON object of a list response. Missing or non-string
  /// id/name become empty strings.
  [[nodiscard]] static Community from_record(const std::string &record_json, CommunityKind kind);
};

} // namespace slackpost::slack
