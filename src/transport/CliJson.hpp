#ifndef __ST_CLI_JSON__
#define __ST_CLI_JSON__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace st {
/**
 * @brief JSON framing of the WebSocket envelopes.
 *
 * A frame is `{"id": ..., "message": {"<variant>": {...}}}` with camelCase
 * variant tags, snake_case fields and byte payloads as integer arrays.
 * Decoding throws runtime_error on malformed input, including an unknown
 * variant tag.
 */
class CliJson {
 public:
  static string encodeRequest(const sshx::CliRequest& request);
  static sshx::CliRequest decodeRequest(const string& text);

  static string encodeResponse(const sshx::CliResponse& response);
  static sshx::CliResponse decodeResponse(const string& text);

  /**
   * @brief Wraps a streamed client update in a request envelope.
   *
   * Hello ("name,token") becomes startChannel.
   * @return false for heartbeats, which are not sent over WebSocket.
   */
  static bool toCliRequest(const sshx::ClientUpdate& update, const string& id,
                           sshx::CliRequest* request);

  /**
   * @brief Extracts a server push from a response envelope.
   * @return false if the response answers a request instead.
   */
  static bool toServerUpdate(const sshx::CliResponse& response,
                             sshx::ServerUpdate* update);
};
}  // namespace st

#endif  // __ST_CLI_JSON__
