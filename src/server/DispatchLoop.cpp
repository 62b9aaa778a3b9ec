#include "emulator-server/server/DispatchLoop.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"

#include <chrono>
#include <system_error>

using json = nlohmann::json;

namespace emuserver {
namespace server {

std::string to_string(DispatchState state) {
  switch (state) {
  case DispatchState::AwaitingRequest:
    return "AwaitingRequest";
  case DispatchState::Validating:
    return "Validating";
  case DispatchState::Executing:
    return "Executing";
  case DispatchState::Encoding:
    return "Encoding";
  case DispatchState::Closed:
    return "Closed";
  }
  return "Unknown";
}

json make_error_response(const ServerError &error) {
  json resp;
  resp["ok"] = false;
  resp["error"] = error.to_json();
  return resp;
}

std::string dump_response(const json &response) {
  return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

DispatchLoop::DispatchLoop(std::shared_ptr<const OperationRegistry> registry,
                           device::DeviceSession &session,
                           const ServerConfig &config,
                           std::string connection_id)
    : registry_(std::move(registry)), session_(session), config_(config) {
  connection_.connection_id = std::move(connection_id);
}

void DispatchLoop::run(Transport &transport) {
  const auto &id = connection_.connection_id;
  LOG_INFO("DISPATCH", id, "Connection opened");

  while (true) {
    state_ = DispatchState::AwaitingRequest;

    std::optional<std::string> line;
    try {
      line = transport.read_message();
    } catch (const std::system_error &e) {
      LOG_ERROR("DISPATCH", id, "Read failed: {}", e.what());
      break;
    }
    if (!line)
      break;
    if (line->find_first_not_of(" \t\r") == std::string::npos)
      continue;

    json response = handle_message(*line);

    try {
      transport.write_message(dump_response(response));
    } catch (const std::system_error &e) {
      LOG_ERROR("DISPATCH", id, "Write failed: {}", e.what());
      break;
    }
    ++requests_served_;
  }

  state_ = DispatchState::Closed;
  LOG_INFO("DISPATCH", id, "Connection closed after {} request(s)",
           requests_served_);
}

json DispatchLoop::handle_message(const std::string &line) {
  state_ = DispatchState::Validating;

  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error &e) {
    state_ = DispatchState::AwaitingRequest;
    LOG_WARN("DISPATCH", connection_.connection_id, "Malformed request: {}",
             e.what());
    return make_error_response(
        ValidationError(ValidationReason::MalformedRequest, "",
                        std::string("request is not valid JSON: ") + e.what()));
  }
  return handle_request(request);
}

json DispatchLoop::handle_request(const json &request) {
  const auto &conn = connection_.connection_id;
  state_ = DispatchState::Validating;
  auto started = std::chrono::steady_clock::now();

  json response;
  std::string op = "?";
  try {
    if (request.is_object()) {
      auto it = request.find("op");
      if (it != request.end() && it->is_string()) {
        op = it->get<std::string>();
      }
    }
    response = execute(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_DEBUG("DISPATCH", conn, "{} ok in {} ms", op, elapsed.count());
  } catch (const ValidationError &e) {
    LOG_WARN("DISPATCH", conn, "{} rejected: {}", op, e.what());
    response = make_error_response(e);
  } catch (const ServerError &e) {
    LOG_WARN("DISPATCH", conn, "{} failed ({}): {}", op,
             error_kind_name(e.kind()), e.what());
    response = make_error_response(e);
  } catch (const std::exception &e) {
    LOG_ERROR("DISPATCH", conn, "{} failed unexpectedly: {}", op, e.what());
    response = make_error_response(InternalError(e.what()));
  }

  if (request.is_object() && request.contains("id")) {
    response["id"] = request.at("id");
  }
  state_ = DispatchState::AwaitingRequest;
  return response;
}

json DispatchLoop::execute(const json &request) {
  if (!request.is_object()) {
    throw ValidationError(ValidationReason::MalformedRequest, "",
                          "request must be a JSON object");
  }
  auto op_it = request.find("op");
  if (op_it == request.end() || !op_it->is_string()) {
    throw ValidationError(ValidationReason::MalformedRequest, "op",
                          "request needs a string 'op'");
  }
  const std::string op = op_it->get<std::string>();
  json args = request.contains("args") ? request.at("args") : json::object();

  auto validated = registry_->validate(op, args);
  const auto *entry = registry_->lookup(op);

  std::chrono::milliseconds timeout = config_.process_timeout;
  if (validated.args.contains("timeout_s")) {
    timeout = std::chrono::seconds(validated.args["timeout_s"].get<int64_t>());
  }

  OperationContext ctx{session_, config_, connection_, *registry_,
                       std::nullopt, timeout};
  if (entry->spec.requires_device) {
    ctx.target = resolve_target(validated.args, timeout);
  }

  state_ = DispatchState::Executing;
  OperationResult result = entry->handler(ctx, validated.args);

  state_ = DispatchState::Encoding;
  json response;
  response["ok"] = true;
  response["result"] = encode_result(result, config_.max_artifact_bytes);
  return response;
}

DeviceTarget DispatchLoop::resolve_target(const json &args,
                                          std::chrono::milliseconds timeout) {
  std::optional<std::string> wanted;
  auto it = args.find("device");
  if (it != args.end() && it->is_string()) {
    wanted = it->get<std::string>();
  } else if (connection_.selected_device) {
    wanted = connection_.selected_device;
  } else if (config_.default_device) {
    wanted = config_.default_device;
  }
  return session_.select_device(wanted, timeout);
}

} // namespace server
} // namespace emuserver
