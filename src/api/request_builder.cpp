#include "poz/api/request_builder.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

#include "poz/util/security.hpp"

namespace poz::api {

namespace {

constexpr const char* kRedacted = "<redacted>";

// Note content is opaque bytes; invalid UTF-8 becomes U+FFFD instead of throwing
std::string serialize(const nlohmann::json& payload) {
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Single-quote a value for a POSIX shell
std::string shellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

}  // namespace

RequestBuilder::RequestBuilder(const poz::config::Config& config) : config_(config) {
}

Result<ApiRequest> RequestBuilder::build(const poz::core::Action& action,
                                         const poz::core::NoteBody* body) const {
  using namespace poz::core;

  if (requiresBody(action) && body == nullptr) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     std::string(actionName(action)) + " needs note content"));
  }

  if (createsNote(action)) {
    return createNote(*body);
  }
  if (std::holds_alternative<ListLast>(action)) {
    return listNotes();
  }
  if (const auto* search = std::get_if<Search>(&action)) {
    return listNotes(search->query);
  }
  if (const auto* update = std::get_if<Update>(&action)) {
    return updateNote(update->note_id, *body);
  }
  const auto& remove = std::get<Delete>(action);
  return deleteNote(remove.note_id);
}

poz::util::HttpRequest RequestBuilder::baseRequest(const std::string& method, const std::string& url,
                                                   bool has_body) const {
  poz::util::HttpRequest request;
  request.method = method;
  request.url = url;
  request.headers.emplace_back("Authorization",
                               poz::util::Security::basicAuthorization(config_.username, config_.password));
  request.headers.emplace_back("X-User-ID", config_.user_id);
  request.headers.emplace_back("Accept", "application/json");
  if (has_body) {
    request.headers.emplace_back("Content-Type", "application/json");
  }
  return request;
}

ApiRequest RequestBuilder::createNote(const poz::core::NoteBody& body) const {
  nlohmann::json payload;
  payload["heading"] = headingFor(body);
  payload["content"] = body.content;
  payload["workspace"] = config_.workspace;
  payload["type"] = "markdown";
  if (!body.tags.empty()) {
    payload["tags"] = body.tags;
  }

  ApiRequest request;
  request.http = baseRequest("POST", config_.base_url + kNotesPath, true);
  request.http.body = serialize(payload);
  request.shape = ResponseShape::kCreated;
  return request;
}

ApiRequest RequestBuilder::listNotes(const std::optional<std::string>& search) const {
  std::string url = config_.base_url + kNotesPath + "?workspace=" + poz::util::urlEncode(config_.workspace);
  if (search.has_value()) {
    url += "&search=" + poz::util::urlEncode(*search);
  }

  ApiRequest request;
  request.http = baseRequest("GET", url, false);
  request.shape = ResponseShape::kListing;
  return request;
}

ApiRequest RequestBuilder::updateNote(const std::string& note_id, const poz::core::NoteBody& body) const {
  nlohmann::json payload;
  payload["content"] = body.content;

  ApiRequest request;
  request.http = baseRequest("PATCH", config_.base_url + kNotesPath + "/" + note_id, true);
  request.http.body = serialize(payload);
  request.shape = ResponseShape::kUpdated;
  request.target_id = note_id;
  return request;
}

ApiRequest RequestBuilder::deleteNote(const std::string& note_id) const {
  ApiRequest request;
  request.http = baseRequest("DELETE", config_.base_url + kNotesPath + "/" + note_id, false);
  request.shape = ResponseShape::kDeleted;
  request.target_id = note_id;
  return request;
}

std::string RequestBuilder::noteUrl(const std::string& note_id) const {
  return config_.base_url + "/index.php?workspace=" + poz::util::urlEncode(config_.workspace) +
         "&note=" + poz::util::urlEncode(note_id);
}

std::string RequestBuilder::headingFor(const poz::core::NoteBody& body) {
  return "cli-" + std::to_string(body.captured_at);
}

std::string RequestBuilder::renderCurl(const poz::util::HttpRequest& request) {
  std::ostringstream cmd;
  cmd << "curl -X " << request.method << " " << shellQuote(request.url);
  for (const auto& [name, value] : request.headers) {
    if (name == "Authorization") {
      auto scheme = value.substr(0, value.find(' '));
      cmd << " -H " << shellQuote(name + ": " + scheme + " " + kRedacted);
    } else {
      cmd << " -H " << shellQuote(name + ": " + value);
    }
  }
  if (!request.body.empty()) {
    cmd << " -d " << shellQuote(request.body);
  }
  return cmd.str();
}

} // namespace poz::api
