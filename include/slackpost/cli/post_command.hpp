#pragma once

#include "slackpost/slack/api_client.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace slackpost::cli {

/// The four inputs of `slackpost post`, each independently required.
struct PostOptions {
  std::optional<std::string> type;
  std::optional<std::string> name;
  std::optional<std::string> token;
  std::optional<std::string> message;

  /// One user-facing error line per missing field; empty when complete.
  [[nodiscard]] std::vector<std::string> validate() const;
};

enum class PostOutcome {
  Success,
  InputError,
  UnsupportedType,
  ListFailure,
  UnknownTarget,
  PostFailure,
};

[[nodiscard]] int exit_code_for(PostOutcome outcome);

/// Single pass of validate -> resolve kind -> list -> match -> post. Nothing
/// is retried and no failure escapes; every terminal state prints one line.
class PostCommand {
public:
  PostCommand(slack::ApiClient client, std::ostream &out, std::ostream &err, bool color = false);

  [[nodiscard]] PostOutcome run(const PostOptions &options);

private:
  void report_error(const std::string &line);
  void report_success(const std::string &line);

  slack::ApiClient client_;
  std::ostream &out_;
  std::ostream &err_;
  bool color_;
};

} // namespace slackpost::cli
