#include "test_framework.hpp"

#include "slackpost/common/json_util.hpp"
#include "slackpost/common/result.hpp"
#include "slackpost/common/strings.hpp"

#include <stdexcept>

void register_common_tests(std::vector<slackpost::tests::TestCase> &tests) {
  using slackpost::tests::require;
  namespace common = slackpost::common;

  tests.push_back({"common_trim_and_lower", [] {
                     require(common::trim("  hi \n") == "hi", "trim mismatch");
                     require(common::trim("   ").empty(), "all-space trim should be empty");
                     require(common::to_lower("ChAnNeL") == "channel", "to_lower mismatch");
                   }});

  tests.push_back({"common_starts_with_empty_prefix", [] {
                     require(common::starts_with("channels", ""), "empty prefix always matches");
                     require(common::starts_with("channels", "chan"), "prefix should match");
                     require(!common::starts_with("chan", "channels"), "longer needle fails");
                   }});

  tests.push_back({"common_result_value_and_error", [] {
                     auto good = common::Result<int>::success(7);
                     require(good.ok() && good.value() == 7, "success should hold value");

                     auto bad = common::Result<int>::failure("boom");
                     require(!bad.ok(), "failure should not be ok");
                     require(bad.error() == "boom", "error mismatch");

                     bool threw = false;
                     try {
                       (void)bad.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");

                     auto done = common::Result<void, std::string>::success();
                     require(done.ok(), "void success should be ok");
                   }});

  tests.push_back({"common_json_validate_accepts_documents", [] {
                     require(common::json_validate(R"({"ok":true,"channels":[]})"), "object");
                     require(common::json_validate(" [1, -2.5e3, \"x\", null, false] "), "array");
                     require(common::json_validate(R"({"n":"caf\u00e9","e":"a\"b"})"), "escapes");
                     require(common::json_validate("42"), "bare number is a value");
                   }});

  tests.push_back({"common_json_validate_rejects_malformed", [] {
                     require(!common::json_validate(""), "empty body");
                     require(!common::json_validate("<html>502</html>"), "html");
                     require(!common::json_validate(R"({"ok":true)"), "truncated");
                     require(!common::json_validate(R"({"ok":true,})"), "trailing comma");
                     require(!common::json_validate(R"({"ok":true} x)"), "trailing garbage");
                     require(!common::json_validate(R"({ok:true})"), "unquoted key");
                     require(!common::json_validate("[01]"), "leading zero");
                     require(!common::json_validate(R"(["\x"])"), "bad escape");
                   }});

  tests.push_back({"common_json_parse_fields_is_top_level_only", [] {
                     const auto fields = common::json_parse_fields(
                         R"({"ok": false, "meta": {"error": "nested"}, "error": "invalid_auth",
                             "channels": [{"id":"C1"}], "count": 3, "none": null})");
                     require(fields.at("ok").kind == common::JsonKind::Bool, "ok kind");
                     require(fields.at("ok").value == "false", "ok value");
                     require(fields.at("error").kind == common::JsonKind::String, "error kind");
                     require(fields.at("error").value == "invalid_auth",
                             "top-level error must win over nested key");
                     require(fields.at("meta").kind == common::JsonKind::Object, "meta kind");
                     require(fields.at("channels").kind == common::JsonKind::Array, "array kind");
                     require(fields.at("count").value == "3", "number raw text");
                     require(fields.at("none").kind == common::JsonKind::Null, "null kind");
                     require(common::json_parse_fields("[1,2]").empty(), "array is not an object");
                   }});

  tests.push_back({"common_json_split_top_level_values", [] {
                     const auto items = common::json_split_top_level_values(
                         R"([{"id":"C1","name":"a,b"}, {"id":"C2","x":[1,2]}, "s", 4])");
                     require(items.size() == 4, "expected four elements");
                     require(items[0] == R"({"id":"C1","name":"a,b"})", "first element");
                     require(items[1] == R"({"id":"C2","x":[1,2]})", "nested array element");
                     require(items[2] == "\"s\"", "string element");
                     require(items[3] == "4", "number element");
                     require(common::json_split_top_level_values("[]").empty(), "empty array");
                   }});

  tests.push_back({"common_json_unescape_unpaired_surrogates", [] {
                     const std::string replacement = "\xEF\xBF\xBD";
                     require(common::json_unescape(R"(\ud800)") == replacement, "lone high");
                     require(common::json_unescape(R"(x\udc00y)") == "x" + replacement + "y",
                             "lone low");
                     require(common::json_unescape(R"(\ud800\u0041)") == replacement + "A",
                             "high followed by a non-surrogate");
                     require(common::json_unescape(R"(\ud800\ud800\udc00)") ==
                                 replacement + "\xF0\x90\x80\x80",
                             "second high pairs with the low half");
                   }});

  tests.push_back({"common_json_unescape_unicode", [] {
                     require(common::json_unescape(R"(caf\u00e9)") == "caf\xC3\xA9", "bmp");
                     require(common::json_unescape(R"(\ud83d\ude00)") == "\xF0\x9F\x98\x80",
                             "surrogate pair");
                     require(common::json_unescape(R"(a\/b\"c)") == "a/b\"c", "simple escapes");
                   }});
}
