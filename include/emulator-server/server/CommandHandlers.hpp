#pragma once

#include "emulator-server/server/OperationContext.hpp"
#include "emulator-server/server/OperationRegistry.hpp"
#include "emulator-server/server/ResultEncoder.hpp"
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace emuserver {
namespace server {

/// Device-control operation handlers.
///
/// Each handler receives arguments that already passed validation (coerced,
/// defaults filled in) and, for device operations, a resolved target in the
/// context. Failures are thrown as ServerError subclasses; the dispatch loop
/// turns them into error responses.

// Capabilities and devices
OperationResult handle_list_operations(OperationContext &ctx,
                                       const nlohmann::json &args);
OperationResult handle_list_devices(OperationContext &ctx,
                                    const nlohmann::json &args);
OperationResult handle_select_device(OperationContext &ctx,
                                     const nlohmann::json &args);
OperationResult handle_get_device_info(OperationContext &ctx,
                                       const nlohmann::json &args);

// Screen and UI
OperationResult handle_capture_screenshot(OperationContext &ctx,
                                          const nlohmann::json &args);
OperationResult handle_get_ui_hierarchy(OperationContext &ctx,
                                        const nlohmann::json &args);
OperationResult handle_find_element(OperationContext &ctx,
                                    const nlohmann::json &args);
OperationResult handle_tap_coordinates(OperationContext &ctx,
                                       const nlohmann::json &args);
OperationResult handle_tap_element(OperationContext &ctx,
                                   const nlohmann::json &args);
OperationResult handle_swipe(OperationContext &ctx, const nlohmann::json &args);
OperationResult handle_input_text(OperationContext &ctx,
                                  const nlohmann::json &args);
OperationResult handle_press_key(OperationContext &ctx,
                                 const nlohmann::json &args);

// Apps
OperationResult handle_install_app(OperationContext &ctx,
                                   const nlohmann::json &args);
OperationResult handle_launch_app(OperationContext &ctx,
                                  const nlohmann::json &args);
OperationResult handle_stop_app(OperationContext &ctx,
                                const nlohmann::json &args);
OperationResult handle_clear_app_data(OperationContext &ctx,
                                      const nlohmann::json &args);
OperationResult handle_list_packages(OperationContext &ctx,
                                     const nlohmann::json &args);

// Network interception
OperationResult handle_setup_proxy(OperationContext &ctx,
                                   const nlohmann::json &args);
OperationResult handle_clear_proxy(OperationContext &ctx,
                                   const nlohmann::json &args);
OperationResult handle_install_certificate(OperationContext &ctx,
                                           const nlohmann::json &args);

// Shell, files and logs
OperationResult handle_execute_shell(OperationContext &ctx,
                                     const nlohmann::json &args);
OperationResult handle_pull_file(OperationContext &ctx,
                                 const nlohmann::json &args);
OperationResult handle_push_file(OperationContext &ctx,
                                 const nlohmann::json &args);
OperationResult handle_get_logs(OperationContext &ctx,
                                const nlohmann::json &args);

/// Register the full operation catalog
void register_builtin_operations(OperationRegistry &registry);

/// Registry with the full catalog, frozen
std::shared_ptr<const OperationRegistry> build_default_registry();

/// Escape text for `input text`: spaces become %s, shell metacharacters get
/// a backslash
std::string escape_input_text(const std::string &text);

/// Split text so no chunk contains a literal "%s", which `input text` would
/// type as a space. Each chunk is sent as its own `input text`.
std::vector<std::string> split_input_text(const std::string &text);

/// Android key code for a key name, if known
std::optional<int> key_code(const std::string &key);

/// Parse `getprop` output lines of the form `[key]: [value]`
std::map<std::string, std::string> parse_getprop(const std::string &text);

} // namespace server
} // namespace emuserver
