/**
 * @file xml_util.cpp
 *
 * Copyright 2024 PreAct Technologies
 */
#include "xml_util.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <sstream>

namespace camscout
{
namespace xml
{

std::optional<ptree> parse(const std::string& text)
{
    try
    {
        std::istringstream in { text };
        ptree doc;
        boost::property_tree::read_xml(in, doc, boost::property_tree::xml_parser::trim_whitespace);
        return doc;
    }
    catch (boost::property_tree::xml_parser_error&)
    {
        return std::nullopt;
    }
}

std::string local_name(const std::string& name)
{
    auto pos = name.rfind(':');
    return (pos == std::string::npos) ? name : name.substr(pos + 1);
}

const ptree* child(const ptree& node, const std::string& local)
{
    for (const auto& entry : node)
    {
        if (local_name(entry.first) == local)
        {
            return &entry.second;
        }
    }
    return nullptr;
}

std::vector<const ptree*> children(const ptree& node, const std::string& local)
{
    std::vector<const ptree*> result;
    for (const auto& entry : node)
    {
        if (local_name(entry.first) == local)
        {
            result.push_back(&entry.second);
        }
    }
    return result;
}

const ptree* descendant(const ptree& node, const std::string& local)
{
    for (const auto& entry : node)
    {
        if (entry.first == "<xmlattr>")
        {
            continue;
        }
        if (local_name(entry.first) == local)
        {
            return &entry.second;
        }
        if (auto found = descendant(entry.second, local))
        {
            return found;
        }
    }
    return nullptr;
}

std::vector<const ptree*> descendants(const ptree& node, const std::string& local)
{
    std::vector<const ptree*> result;
    for (const auto& entry : node)
    {
        if (entry.first == "<xmlattr>")
        {
            continue;
        }
        if (local_name(entry.first) == local)
        {
            result.push_back(&entry.second);
        }
        auto nested = descendants(entry.second, local);
        result.insert(result.end(), nested.begin(), nested.end());
    }
    return result;
}

std::string text(const ptree* node)
{
    if (node == nullptr)
    {
        return {};
    }
    return boost::algorithm::trim_copy(node->data());
}

std::string child_text(const ptree& node, const std::string& local)
{
    return text(child(node, local));
}

std::string escape(const std::string& value)
{
    std::string result;
    result.reserve(value.size());
    for (char c : value)
    {
        switch (c)
        {
            case '&':  result += "&amp;";  break;
            case '<':  result += "&lt;";   break;
            case '>':  result += "&gt;";   break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default:   result += c;        break;
        }
    }
    return result;
}

} // namespace xml
} // namespace camscout
