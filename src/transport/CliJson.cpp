#include "CliJson.hpp"

namespace st {
namespace {
const json& field(const json& object, const string& key) {
  if (!object.is_object()) {
    throw runtime_error("Expected an object around field " + key);
  }
  auto it = object.find(key);
  if (it == object.end()) {
    throw runtime_error("Missing field " + key);
  }
  return *it;
}

string stringField(const json& object, const string& key) {
  const json& value = field(object, key);
  if (!value.is_string()) {
    throw runtime_error("Field " + key + " is not a string");
  }
  return value.get<string>();
}

uint64_t unsignedField(const json& object, const string& key) {
  const json& value = field(object, key);
  if (!value.is_number_unsigned()) {
    throw runtime_error("Field " + key + " is not an unsigned integer");
  }
  return value.get<uint64_t>();
}

uint32_t idField(const json& object, const string& key) {
  uint64_t value = unsignedField(object, key);
  if (value > numeric_limits<uint32_t>::max()) {
    throw runtime_error("Field " + key + " is out of range");
  }
  return uint32_t(value);
}

int32_t signedField(const json& object, const string& key) {
  const json& value = field(object, key);
  if (!value.is_number_integer()) {
    throw runtime_error("Field " + key + " is not an integer");
  }
  int64_t result = value.get<int64_t>();
  if (result < numeric_limits<int32_t>::min() ||
      result > numeric_limits<int32_t>::max()) {
    throw runtime_error("Field " + key + " is out of range");
  }
  return int32_t(result);
}

// Invalid UTF-8 in user supplied strings becomes U+FFFD
string serialize(const json& root) {
  return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Splits {"id": ..., "message": {"<tag>": body}} into its parts
json parseEnvelope(const string& text, string* id, string* tag) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::exception& ex) {
    throw runtime_error(string("Malformed JSON frame: ") + ex.what());
  }
  *id = stringField(root, "id");
  const json& message = field(root, "message");
  if (!message.is_object() || message.size() != 1) {
    throw runtime_error("Message must have exactly one variant");
  }
  *tag = message.begin().key();
  return message.begin().value();
}

json newShellJson(const sshx::NewShell& shell) {
  return {{"id", shell.id()}, {"x", shell.x()}, {"y", shell.y()}};
}

void readNewShell(const json& body, sshx::NewShell* shell) {
  shell->set_id(idField(body, "id"));
  shell->set_x(signedField(body, "x"));
  shell->set_y(signedField(body, "y"));
}
}  // namespace

string CliJson::encodeRequest(const sshx::CliRequest& request) {
  json message;
  switch (request.cli_message_case()) {
    case sshx::CliRequest::kOpenSession: {
      const sshx::OpenRequest& open = request.open_session();
      json body = {{"origin", open.origin()},
                   {"encrypted_zeros", bytesToJson(open.encrypted_zeros())},
                   {"name", open.name()},
                   {"write_password_hash", nullptr}};
      if (open.has_write_password_hash()) {
        body["write_password_hash"] = bytesToJson(open.write_password_hash());
      }
      message["openSession"] = body;
      break;
    }
    case sshx::CliRequest::kCloseSession:
      message["closeSession"] = {{"name", request.close_session().name()},
                                 {"token", request.close_session().token()}};
      break;
    case sshx::CliRequest::kStartChannel:
      message["startChannel"] = {{"name", request.start_channel().name()},
                                 {"token", request.start_channel().token()}};
      break;
    case sshx::CliRequest::kTerminalData:
      message["terminalData"] = {
          {"id", request.terminal_data().id()},
          {"data", bytesToJson(request.terminal_data().data())},
          {"seq", request.terminal_data().seq()}};
      break;
    case sshx::CliRequest::kCreatedShell:
      message["createdShell"] = newShellJson(request.created_shell());
      break;
    case sshx::CliRequest::kClosedShell:
      message["closedShell"] = {{"id", request.closed_shell()}};
      break;
    case sshx::CliRequest::kPong:
      message["pong"] = {{"timestamp", request.pong()}};
      break;
    case sshx::CliRequest::kError:
      message["error"] = {{"message", request.error()}};
      break;
    case sshx::CliRequest::CLI_MESSAGE_NOT_SET:
      throw runtime_error("Cannot encode a request without a message");
  }
  json root = {{"id", request.id()}, {"message", message}};
  return serialize(root);
}

sshx::CliRequest CliJson::decodeRequest(const string& text) {
  string id, tag;
  json body = parseEnvelope(text, &id, &tag);
  sshx::CliRequest request;
  request.set_id(id);
  if (tag == "openSession") {
    sshx::OpenRequest* open = request.mutable_open_session();
    open->set_origin(stringField(body, "origin"));
    open->set_encrypted_zeros(jsonToBytes(field(body, "encrypted_zeros")));
    open->set_name(stringField(body, "name"));
    auto it = body.find("write_password_hash");
    if (it != body.end() && !it->is_null()) {
      open->set_write_password_hash(jsonToBytes(*it));
    }
  } else if (tag == "closeSession") {
    request.mutable_close_session()->set_name(stringField(body, "name"));
    request.mutable_close_session()->set_token(stringField(body, "token"));
  } else if (tag == "startChannel") {
    request.mutable_start_channel()->set_name(stringField(body, "name"));
    request.mutable_start_channel()->set_token(stringField(body, "token"));
  } else if (tag == "terminalData") {
    sshx::TerminalData* data = request.mutable_terminal_data();
    data->set_id(idField(body, "id"));
    data->set_data(jsonToBytes(field(body, "data")));
    data->set_seq(unsignedField(body, "seq"));
  } else if (tag == "createdShell") {
    readNewShell(body, request.mutable_created_shell());
  } else if (tag == "closedShell") {
    request.set_closed_shell(idField(body, "id"));
  } else if (tag == "pong") {
    request.set_pong(unsignedField(body, "timestamp"));
  } else if (tag == "error") {
    request.set_error(stringField(body, "message"));
  } else {
    throw runtime_error("Unknown request variant: " + tag);
  }
  return request;
}

string CliJson::encodeResponse(const sshx::CliResponse& response) {
  json message;
  switch (response.cli_response_message_case()) {
    case sshx::CliResponse::kOpenSession:
      message["openSession"] = {{"name", response.open_session().name()},
                                {"token", response.open_session().token()},
                                {"url", response.open_session().url()}};
      break;
    case sshx::CliResponse::kCloseSession:
      message["closeSession"] = json::object();
      break;
    case sshx::CliResponse::kStartChannel:
      message["startChannel"] = json::object();
      break;
    case sshx::CliResponse::kTerminalInput:
      message["terminalInput"] = {
          {"id", response.terminal_input().id()},
          {"data", bytesToJson(response.terminal_input().data())},
          {"offset", response.terminal_input().offset()}};
      break;
    case sshx::CliResponse::kCreateShell:
      message["createShell"] = newShellJson(response.create_shell());
      break;
    case sshx::CliResponse::kCloseShell:
      message["closeShell"] = {{"id", response.close_shell()}};
      break;
    case sshx::CliResponse::kSync: {
      json numbers = json::object();
      for (const auto& entry : response.sync().map()) {
        numbers[to_string(entry.first)] = entry.second;
      }
      message["sync"] = {{"sequence_numbers", numbers}};
      break;
    }
    case sshx::CliResponse::kResize:
      message["resize"] = {{"id", response.resize().id()},
                           {"rows", response.resize().rows()},
                           {"cols", response.resize().cols()}};
      break;
    case sshx::CliResponse::kPing:
      message["ping"] = {{"timestamp", response.ping()}};
      break;
    case sshx::CliResponse::kError:
      message["error"] = {{"message", response.error()}};
      break;
    case sshx::CliResponse::CLI_RESPONSE_MESSAGE_NOT_SET:
      throw runtime_error("Cannot encode a response without a message");
  }
  json root = {{"id", response.id()}, {"message", message}};
  return serialize(root);
}

sshx::CliResponse CliJson::decodeResponse(const string& text) {
  string id, tag;
  json body = parseEnvelope(text, &id, &tag);
  sshx::CliResponse response;
  response.set_id(id);
  if (tag == "openSession") {
    sshx::OpenResponse* open = response.mutable_open_session();
    open->set_name(stringField(body, "name"));
    open->set_token(stringField(body, "token"));
    open->set_url(stringField(body, "url"));
  } else if (tag == "closeSession") {
    response.mutable_close_session();
  } else if (tag == "startChannel") {
    response.mutable_start_channel();
  } else if (tag == "terminalInput") {
    sshx::TerminalInput* input = response.mutable_terminal_input();
    input->set_id(idField(body, "id"));
    input->set_data(jsonToBytes(field(body, "data")));
    input->set_offset(unsignedField(body, "offset"));
  } else if (tag == "createShell") {
    readNewShell(body, response.mutable_create_shell());
  } else if (tag == "closeShell") {
    response.set_close_shell(idField(body, "id"));
  } else if (tag == "sync") {
    const json& numbers = field(body, "sequence_numbers");
    if (!numbers.is_object()) {
      throw runtime_error("sequence_numbers is not an object");
    }
    auto* map = response.mutable_sync()->mutable_map();
    for (auto it = numbers.begin(); it != numbers.end(); ++it) {
      uint32_t shellId;
      try {
        size_t consumed = 0;
        unsigned long parsed = stoul(it.key(), &consumed);
        if (consumed != it.key().length() ||
            parsed > numeric_limits<uint32_t>::max()) {
          throw runtime_error("out of range");
        }
        shellId = uint32_t(parsed);
      } catch (const std::exception& ex) {
        throw runtime_error("Invalid shell id in sync: " + it.key());
      }
      if (!it.value().is_number_unsigned()) {
        throw runtime_error("Invalid sequence number for shell " + it.key());
      }
      (*map)[shellId] = it.value().get<uint64_t>();
    }
  } else if (tag == "resize") {
    sshx::TerminalSize* size = response.mutable_resize();
    size->set_id(idField(body, "id"));
    size->set_rows(idField(body, "rows"));
    size->set_cols(idField(body, "cols"));
  } else if (tag == "ping") {
    response.set_ping(unsignedField(body, "timestamp"));
  } else if (tag == "error") {
    response.set_error(stringField(body, "message"));
  } else {
    throw runtime_error("Unknown response variant: " + tag);
  }
  return response;
}

bool CliJson::toCliRequest(const sshx::ClientUpdate& update, const string& id,
                           sshx::CliRequest* request) {
  request->Clear();
  request->set_id(id);
  switch (update.client_message_case()) {
    case sshx::ClientUpdate::kHello: {
      vector<string> tokens = split(update.hello(), ',');
      if (tokens.size() != 2) {
        throw runtime_error("Invalid hello: " + update.hello());
      }
      request->mutable_start_channel()->set_name(tokens[0]);
      request->mutable_start_channel()->set_token(tokens[1]);
      return true;
    }
    case sshx::ClientUpdate::kData:
      *request->mutable_terminal_data() = update.data();
      return true;
    case sshx::ClientUpdate::kCreatedShell:
      *request->mutable_created_shell() = update.created_shell();
      return true;
    case sshx::ClientUpdate::kClosedShell:
      request->set_closed_shell(update.closed_shell());
      return true;
    case sshx::ClientUpdate::kPong:
      request->set_pong(update.pong());
      return true;
    case sshx::ClientUpdate::kError:
      request->set_error(update.error());
      return true;
    case sshx::ClientUpdate::CLIENT_MESSAGE_NOT_SET:
      return false;
  }
  return false;
}

bool CliJson::toServerUpdate(const sshx::CliResponse& response,
                             sshx::ServerUpdate* update) {
  update->Clear();
  switch (response.cli_response_message_case()) {
    case sshx::CliResponse::kTerminalInput:
      *update->mutable_input() = response.terminal_input();
      return true;
    case sshx::CliResponse::kCreateShell:
      *update->mutable_create_shell() = response.create_shell();
      return true;
    case sshx::CliResponse::kCloseShell:
      update->set_close_shell(response.close_shell());
      return true;
    case sshx::CliResponse::kSync:
      *update->mutable_sync() = response.sync();
      return true;
    case sshx::CliResponse::kResize:
      *update->mutable_resize() = response.resize();
      return true;
    case sshx::CliResponse::kPing:
      update->set_ping(response.ping());
      return true;
    case sshx::CliResponse::kError:
      update->set_error(response.error());
      return true;
    case sshx::CliResponse::kOpenSession:
    case sshx::CliResponse::kCloseSession:
    case sshx::CliResponse::kStartChannel:
    case sshx::CliResponse::CLI_RESPONSE_MESSAGE_NOT_SET:
      return false;
  }
  return false;
}
}  // namespace st
