#pragma once

#include <optional>
#include <string>

#include "poz/common.hpp"
#include "poz/config/config.hpp"
#include "poz/core/action.hpp"
#include "poz/core/note_body.hpp"
#include "poz/util/http_client.hpp"

namespace poz::api {

// How a successful response is interpreted
enum class ResponseShape {
  kCreated,   // {"note": {"id": ...}}
  kListing,   // {"notes": [{...}, ...]}, most recent first
  kUpdated,   // {"note": {...}} or empty
  kDeleted    // body ignored
};

struct ApiRequest {
  poz::util::HttpRequest http;
  ResponseShape shape = ResponseShape::kCreated;
  // Note addressed by update/delete requests
  std::optional<std::string> target_id;

  bool operator==(const ApiRequest&) const = default;
};

/**
 * @brief Maps an Action to the Poznote REST request, without any I/O
 *
 * The same (Action, Config, NoteBody) always yields the same request, byte
 * for byte, so the debug rendering matches what is sent.
 */
class RequestBuilder {
public:
  static constexpr const char* kNotesPath = "/api/v1/notes";

  explicit RequestBuilder(const poz::config::Config& config);

  /**
   * Build the request for an action. Create, Burn and Update need a body;
   * calling them without one is kInvalidArgument.
   */
  Result<ApiRequest> build(const poz::core::Action& action,
                           const poz::core::NoteBody* body = nullptr) const;

  ApiRequest createNote(const poz::core::NoteBody& body) const;
  ApiRequest listNotes(const std::optional<std::string>& search = std::nullopt) const;
  ApiRequest updateNote(const std::string& note_id, const poz::core::NoteBody& body) const;
  ApiRequest deleteNote(const std::string& note_id) const;

  // Shareable browser link for a note
  std::string noteUrl(const std::string& note_id) const;

  // Heading given to notes created from the command line
  static std::string headingFor(const poz::core::NoteBody& body);

  /**
   * Render the request as an equivalent curl command line. The
   * Authorization value is replaced by a placeholder.
   */
  static std::string renderCurl(const poz::util::HttpRequest& request);

private:
  poz::util::HttpRequest baseRequest(const std::string& method, const std::string& url,
                                     bool has_body) const;

  const poz::config::Config& config_;
};

} // namespace poz::api
