#include "protocol.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>
#include "error.h"
#include "language.h"

namespace runbox {

namespace pt = boost::property_tree;

namespace {

bool ParseJson(StringView body, pt::ptree& tree) {
  std::istringstream stream(body.to_string());
  try {
    pt::read_json(stream, tree);
  } catch (const pt::json_parser_error& e) {
    VLOG(1) << "Bad request body: " << e.what();
    return false;
  }
  return true;
}

String WriteJson(const pt::ptree& tree) {
  std::ostringstream stream;
  pt::write_json(stream, tree, /*pretty=*/false);
  String json = stream.str();
  boost::algorithm::trim_right(json);
  return json;
}

// Keys of the request are plain names; reading them as single path elements
// keeps a "." in a dependency name literal.
Optional<String> GetString(const pt::ptree& tree, const char* key) {
  auto iter = tree.find(key);
  if (iter == tree.not_found() || !iter->second.empty()) {
    return boost::none;
  }
  return iter->second.data();
}

}  // namespace

ErrorCode ParseExecuteRequest(StringView body, ExecuteRequest& request) {
  pt::ptree tree;
  if (!ParseJson(body, tree)) {
    return Errc::kInvalidBundle;
  }
  Optional<String> session_id = GetString(tree, "sessionId");
  Optional<String> language = GetString(tree, "language");
  if (!session_id || session_id->empty() || !language) {
    return Errc::kInvalidBundle;
  }
  request = ExecuteRequest();
  request.session_id = *session_id;
  request.language = *language;
  request.input = GetString(tree, "input");

  if (Optional<String> code = GetString(tree, "code")) {
    Optional<Language> parsed = ParseLanguage(*language);
    if (!parsed) {
      return Errc::kUnsupportedLanguage;
    }
    String name = GetLanguage(*parsed).DefaultFileName(*code);
    request.files.push_back(SourceFile{name, *code});
    request.entry_file = name;
    return ErrorCode();
  }

  auto files = tree.find("files");
  if (files == tree.not_found()) {
    return Errc::kInvalidBundle;
  }
  for (const auto& item : files->second) {
    Optional<String> name = GetString(item.second, "name");
    Optional<String> content = GetString(item.second, "content");
    if (!item.first.empty() || !name || !content) {
      return Errc::kInvalidBundle;
    }
    request.files.push_back(SourceFile{*name, *content});
  }
  if (Optional<String> entry_file = GetString(tree, "entryFile")) {
    request.entry_file = *entry_file;
  } else if (!request.files.empty()) {
    request.entry_file = request.files.front().name;
  }

  auto dependencies = tree.find("dependencies");
  if (dependencies != tree.not_found()) {
    for (const auto& item : dependencies->second) {
      if (item.first.empty() || !item.second.empty()) {
        return Errc::kInvalidBundle;
      }
      request.dependencies[item.first] = item.second.data();
    }
  }
  return ErrorCode();
}

ErrorCode ParseInputRequest(StringView body,
                            String& session_id,
                            String& input) {
  pt::ptree tree;
  if (!ParseJson(body, tree)) {
    return Errc::kInvalidBundle;
  }
  Optional<String> id = GetString(tree, "sessionId");
  Optional<String> text = GetString(tree, "input");
  if (!id || !text) {
    return Errc::kInvalidBundle;
  }
  session_id = *id;
  input = *text;
  return ErrorCode();
}

ErrorCode ParseStopRequest(StringView body, String& session_id) {
  pt::ptree tree;
  if (!ParseJson(body, tree)) {
    return Errc::kInvalidBundle;
  }
  Optional<String> id = GetString(tree, "sessionId");
  if (!id) {
    return Errc::kInvalidBundle;
  }
  session_id = *id;
  return ErrorCode();
}

String EncodeEvent(const Event& event) {
  pt::ptree tree;
  tree.put("type", String(EventTypeName(event.type)));
  tree.put("data", event.data);
  return "data: " + WriteJson(tree) + "\n\n";
}

String EncodeKeepAlive() {
  return ": keep-alive\n\n";
}

String EncodeResult(const ErrorCode& ec) {
  if (!ec) {
    return R"({"success":true})";
  }
  // The ptree writer quotes every value, so the boolean is spliced in.
  pt::ptree tree;
  tree.put("error", ec.message());
  String json = WriteJson(tree);
  return R"({"success":false,)" + json.substr(1);
}

}  // namespace runbox
