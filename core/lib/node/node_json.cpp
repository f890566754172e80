// stencil/node/node_json.cpp - JSON export of built trees
//
#include "stencil/node/node_json.hpp"

#include <string>

#include "stencil/loader/template_json.hpp"

namespace stencil
{

using nlohmann::ordered_json;

ordered_json to_json(const LayoutNode & node)
{
  ordered_json j{{"class", node.class_name()}};
  if (!node.outlet().empty()) {
    j["outlet"] = node.outlet();
  }
  j["state"] = std::string(to_string(node.state()));

  ordered_json props = ordered_json::object();
  for (const auto & [name, value] : node.property_values()) {
    props[name] = value_to_json(value);
  }
  j["properties"] = std::move(props);

  if (auto err = node.merge_error()) {
    j["merge_error"] = ordered_json{{"code", std::string(err->code())}, {"message", err->describe()}};
  }

  ordered_json children = ordered_json::array();
  for (const auto & child : node.children()) {
    children.push_back(to_json(*child));
  }
  j["children"] = std::move(children);
  return j;
}

}  // namespace stencil
