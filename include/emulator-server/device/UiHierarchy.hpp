#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace emuserver {
namespace device {

struct UiBounds {
  int left{0};
  int top{0};
  int right{0};
  int bottom{0};

  int center_x() const { return (left + right) / 2; }
  int center_y() const { return (top + bottom) / 2; }
};

/// One `<node>` of a uiautomator window dump
struct UiNode {
  std::string text;
  std::string resource_id;
  std::string class_name;
  std::string content_desc;
  std::string package;
  std::string bounds_text;
  std::optional<UiBounds> bounds;
  bool clickable{false};
  bool enabled{false};

  nlohmann::json to_json() const;
};

/// Exact-match search criteria; unset fields match anything
struct ElementCriteria {
  std::optional<std::string> text;
  std::optional<std::string> resource_id;
  std::optional<std::string> class_name;
  std::optional<std::string> content_desc;

  bool empty() const {
    return !text && !resource_id && !class_name && !content_desc;
  }

  bool matches(const UiNode &node) const;
};

/// Parse "[x1,y1][x2,y2]"
std::optional<UiBounds> parse_bounds(const std::string &text);

/// Flatten every node of a dump in document order.
/// Throws std::invalid_argument when the text holds no hierarchy.
std::vector<UiNode> parse_ui_hierarchy(const std::string &xml);

std::vector<UiNode> find_elements(const std::vector<UiNode> &nodes,
                                  const ElementCriteria &criteria);

} // namespace device
} // namespace emuserver
