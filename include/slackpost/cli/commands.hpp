#pragma once

#include "slackpost/http/client.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace slackpost::cli {

void print_help(std::ostream &out, bool color);

/// Entry point for the slackpost binary.
int run_cli(int argc, char **argv);

/// args excludes the program name. http_client is used for every API call.
int run_cli(std::vector<std::string> args, std::shared_ptr<http::HttpClient> http_client,
            std::ostream &out, std::ostream &err, bool color = false);

} // namespace slackpost::cli
