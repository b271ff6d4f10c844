/**
 * @file mdns_resolver.cpp
 *
 * Copyright 2024 PreAct Technologies
 */
#include "mdns_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace camscout
{
namespace mdns
{

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::optional<std::string> first_of(const std::map<std::string, std::string>& txt,
                                           std::initializer_list<const char*> keys)
{
    for (auto key : keys)
    {
        for (const auto& [k, v] : txt)
        {
            if (to_lower(k) == key && !v.empty())
            {
                return v;
            }
        }
    }
    return std::nullopt;
}

candidate_list_t resolve_services(const std::vector<ReceivedRecord>& records,
                                  const std::vector<std::string>& service_types)
{
    struct Instance
    {
        std::string service_type;
        std::string sender;
        std::string display_name;
    };
    std::map<std::string, Instance> instances;
    std::map<std::string, SrvData> srv;
    std::map<std::string, std::map<std::string, std::string>> txt;
    std::map<std::string, std::string> hosts;

    std::set<std::string> wanted;
    for (const auto& type : service_types)
    {
        wanted.insert(to_lower(type));
    }

    for (const auto& received : records)
    {
        const auto& r = received.record;
        const auto name = to_lower(r.name);
        if (auto ptr = std::get_if<PtrData>(&r.data))
        {
            if (wanted.count(name) > 0)
            {
                instances[to_lower(ptr->target)] = { name, received.sender, ptr->target };
            }
        }
        else if (auto s = std::get_if<SrvData>(&r.data))
        {
            srv[name] = *s;
        }
        else if (auto t = std::get_if<TxtData>(&r.data))
        {
            txt[name] = t->entries;
        }
        else if (auto a = std::get_if<AData>(&r.data))
        {
            hosts[name] = a->address;
        }
    }

    candidate_list_t result;
    std::set<std::tuple<std::string, uint16_t>> seen;
    for (const auto& [instance, info] : instances)
    {
        auto srvIt = srv.find(instance);
        if (srvIt == srv.end())
        {
            continue;
        }
        DiscoveredCandidate candidate;
        auto hostIt = hosts.find(to_lower(srvIt->second.target));
        candidate.ip = (hostIt != hosts.end()) ? hostIt->second : info.sender;
        candidate.port = srvIt->second.port;
        if (candidate.ip.empty() || !seen.insert(candidate.key()).second)
        {
            continue;
        }
        candidate.method = DiscoveryMethod::mdns;
        candidate.service_type = info.service_type;
        candidate.protocol = (info.service_type.find("_onvif.") == 0) ? "ONVIF" : "HTTP";

        const auto suffix_length = info.service_type.size() + 1;
        candidate.name = (info.display_name.size() > suffix_length)
            ? info.display_name.substr(0, info.display_name.size() - suffix_length)
            : info.display_name;

        auto txtIt = txt.find(instance);
        if (txtIt != txt.end())
        {
            candidate.manufacturer = first_of(txtIt->second, { "manufacturer", "mfr", "vendor" });
            candidate.model = first_of(txtIt->second, { "model", "md", "hardware" });
            candidate.metadata = txtIt->second;
        }
        candidate.metadata["service_type"] = info.service_type;
        result.push_back(candidate);
    }
    return result;
}

} // namespace mdns
} // namespace camscout
