#include "slackpost/slack/community.hpp"

#include "slackpost/common/json_util.hpp"

namespace slackpost::slack {

namespace {

std::string string_field(const common::JsonFieldMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.kind != common::JsonKind::String) {
    return "";
  }
  return it->second.value;
}

} // namespace

std::string_view kind_name(const CommunityKind kind) {
  switch (kind) {
  case CommunityKind::Channel:
    return "channel";
  case CommunityKind::Group:
    return "group";
  }
  return "channel";
}

std::string collection_key(const CommunityKind kind) { return std::string(kind_name(kind)) + "s"; }

std::string Community::label() const {
  if (kind == CommunityKind::Group) {
    return name + " " + std::string(kind_name(kind));
  }
  return "#" + name;
}

Community Community::from_record(const std::string &record_json, const CommunityKind kind) {
  const auto fields = common::json_parse_fields(record_json);
  Community community;
  community.id = string_field(fields, "id");
  community.name = string_field(fields, "name");
  community.kind = kind;
  return community;
}

} // namespace slackpost::slack
