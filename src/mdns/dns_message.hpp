#ifndef CAMSCOUT_DNS_MESSAGE_HPP
#define CAMSCOUT_DNS_MESSAGE_HPP
/**
 * @file dns_message.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Minimal DNS message codec for multicast DNS service discovery.
 * Supports the record types needed to resolve a service instance
 * (PTR, SRV, TXT and A). Other record types are carried as raw bytes.
 */
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace camscout
{
namespace mdns
{

inline constexpr uint16_t TYPE_A     { 1 };
inline constexpr uint16_t TYPE_PTR   { 12 };
inline constexpr uint16_t TYPE_TXT   { 16 };
inline constexpr uint16_t TYPE_AAAA  { 28 };
inline constexpr uint16_t TYPE_SRV   { 33 };
inline constexpr uint16_t TYPE_ANY   { 255 };

inline constexpr uint16_t CLASS_IN       { 1 };
inline constexpr uint16_t CLASS_MASK     { 0x7FFF };    ///< top bit is unicast-response / cache-flush
inline constexpr uint16_t FLAG_RESPONSE  { 0x8000 };
inline constexpr uint16_t FLAG_AUTHORITATIVE { 0x0400 };

inline constexpr uint16_t MDNS_PORT { 5353 };
inline constexpr auto MDNS_ADDRESS { "224.0.0.251" };

struct PtrData
{
    std::string target;
};

struct SrvData
{
    uint16_t priority { 0 };
    uint16_t weight { 0 };
    uint16_t port { 0 };
    std::string target;
};

struct AData
{
    std::string address;
};

struct TxtData
{
    std::map<std::string, std::string> entries;
};

struct RawData
{
    std::vector<uint8_t> bytes;
};

typedef std::variant<RawData, PtrData, SrvData, AData, TxtData> record_data_t;

struct DnsQuestion
{
    std::string name;
    uint16_t type { TYPE_PTR };
    bool unicast_response { false };
};

struct DnsRecord
{
    std::string name;
    uint16_t type { 0 };
    uint16_t rclass { CLASS_IN };
    uint32_t ttl { 0 };
    record_data_t data;
};

struct DnsMessage
{
    uint16_t id { 0 };
    uint16_t flags { 0 };
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    bool is_response() const { return (flags & FLAG_RESPONSE) != 0; }

    /// Every answer, authority and additional record in wire order.
    std::vector<DnsRecord> all_records() const;

    /// Encode without name compression.
    std::vector<uint8_t> encode() const;

    /// @brief Decode a message, following compression pointers.
    /// @return std::nullopt for truncated or malformed input.
    static std::optional<DnsMessage> decode(const uint8_t* data, std::size_t size);
};

/// Build a query asking for the PTR records of each service type.
DnsMessage make_ptr_query(const std::vector<std::string>& service_types);

} // namespace mdns
} // namespace camscout

#endif // CAMSCOUT_DNS_MESSAGE_HPP
