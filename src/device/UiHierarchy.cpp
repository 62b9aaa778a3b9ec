#include "emulator-server/device/UiHierarchy.hpp"

#include <map>
#include <regex>
#include <stdexcept>

namespace emuserver {
namespace device {

namespace {

std::string decode_entities(const std::string &value) {
  if (value.find('&') == std::string::npos)
    return value;

  static const std::map<std::string, std::string> named = {
      {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}};

  std::string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '&') {
      out += value[i++];
      continue;
    }
    auto semi = value.find(';', i);
    if (semi == std::string::npos) {
      out += value.substr(i);
      break;
    }
    std::string entity = value.substr(i + 1, semi - i - 1);
    auto it = named.find(entity);
    if (it != named.end()) {
      out += it->second;
    } else if (entity.size() > 1 && entity[0] == '#') {
      unsigned long code = 0;
      try {
        code = entity[1] == 'x' ? std::stoul(entity.substr(2), nullptr, 16)
                                : std::stoul(entity.substr(1));
      } catch (const std::exception &) {
        out += value.substr(i, semi - i + 1);
        i = semi + 1;
        continue;
      }
      // UTF-8 encode
      if (code < 0x80) {
        out += static_cast<char>(code);
      } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
      } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
      }
    } else {
      out += value.substr(i, semi - i + 1);
    }
    i = semi + 1;
  }
  return out;
}

bool matches_field(const std::optional<std::string> &wanted,
                   const std::string &actual) {
  return !wanted || *wanted == actual;
}

} // namespace

nlohmann::json UiNode::to_json() const {
  nlohmann::json j;
  j["text"] = text;
  j["resource_id"] = resource_id;
  j["class_name"] = class_name;
  j["content_desc"] = content_desc;
  j["package"] = package;
  j["bounds"] = bounds_text;
  if (bounds) {
    j["center"] = {{"x", bounds->center_x()}, {"y", bounds->center_y()}};
  }
  j["clickable"] = clickable;
  j["enabled"] = enabled;
  return j;
}

bool ElementCriteria::matches(const UiNode &node) const {
  return matches_field(text, node.text) &&
         matches_field(resource_id, node.resource_id) &&
         matches_field(class_name, node.class_name) &&
         matches_field(content_desc, node.content_desc);
}

std::optional<UiBounds> parse_bounds(const std::string &text) {
  static const std::regex bounds_re(
      R"(^\s*\[(-?\d+),(-?\d+)\]\[(-?\d+),(-?\d+)\]\s*$)");
  std::smatch m;
  if (!std::regex_match(text, m, bounds_re)) {
    return std::nullopt;
  }
  UiBounds b;
  b.left = std::stoi(m[1].str());
  b.top = std::stoi(m[2].str());
  b.right = std::stoi(m[3].str());
  b.bottom = std::stoi(m[4].str());
  return b;
}

std::vector<UiNode> parse_ui_hierarchy(const std::string &xml) {
  if (xml.find("<hierarchy") == std::string::npos) {
    throw std::invalid_argument("UI dump does not contain a <hierarchy> root");
  }

  static const std::regex node_re(R"(<node\b([^>]*)>)");
  static const std::regex attr_re(R"(([\w:-]+)\s*=\s*\"([^\"]*)\")");

  std::vector<UiNode> nodes;
  for (auto it = std::sregex_iterator(xml.begin(), xml.end(), node_re);
       it != std::sregex_iterator(); ++it) {
    const std::string attrs = (*it)[1].str();

    UiNode node;
    for (auto a = std::sregex_iterator(attrs.begin(), attrs.end(), attr_re);
         a != std::sregex_iterator(); ++a) {
      const std::string key = (*a)[1].str();
      const std::string value = decode_entities((*a)[2].str());
      if (key == "text") {
        node.text = value;
      } else if (key == "resource-id") {
        node.resource_id = value;
      } else if (key == "class") {
        node.class_name = value;
      } else if (key == "content-desc") {
        node.content_desc = value;
      } else if (key == "package") {
        node.package = value;
      } else if (key == "bounds") {
        node.bounds_text = value;
        node.bounds = parse_bounds(value);
      } else if (key == "clickable") {
        node.clickable = value == "true";
      } else if (key == "enabled") {
        node.enabled = value == "true";
      }
    }
    nodes.push_back(std::move(node));
  }
  return nodes;
}

std::vector<UiNode> find_elements(const std::vector<UiNode> &nodes,
                                  const ElementCriteria &criteria) {
  std::vector<UiNode> found;
  if (criteria.empty())
    return found;
  for (const auto &node : nodes) {
    if (criteria.matches(node)) {
      found.push_back(node);
    }
  }
  return found;
}

} // namespace device
} // namespace emuserver
