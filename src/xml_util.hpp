#ifndef CAMSCOUT_XML_UTIL_HPP
#define CAMSCOUT_XML_UTIL_HPP
/**
 * @file xml_util.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Namespace-agnostic lookups over Boost.PropertyTree XML documents.
 * Element names are compared by local name, so "d:Types" and "Types" match alike.
 */
#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{
namespace xml
{

typedef boost::property_tree::ptree ptree;

/// @return The parsed document, or std::nullopt if text is not well formed XML.
std::optional<ptree> parse(const std::string& text);

/// "soap:Body" -> "Body"
std::string local_name(const std::string& name);

const ptree* child(const ptree& node, const std::string& local);
std::vector<const ptree*> children(const ptree& node, const std::string& local);

/// Depth-first search below node.
const ptree* descendant(const ptree& node, const std::string& local);
std::vector<const ptree*> descendants(const ptree& node, const std::string& local);

/// Trimmed text of a direct child, empty when absent.
std::string child_text(const ptree& node, const std::string& local);
std::string text(const ptree* node);

/// Escape &, <, >, " and ' for inclusion in element text or attributes.
std::string escape(const std::string& value);

} // namespace xml
} // namespace camscout

#endif // CAMSCOUT_XML_UTIL_HPP
