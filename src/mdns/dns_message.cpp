/**
 * @file dns_message.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * DNS wire format encoding and decoding
 */
#include "dns_message.hpp"
#include "CamEndian.hpp"
#include <sstream>

namespace camscout
{
namespace mdns
{

constexpr std::size_t HEADER_SIZE { 12 };
constexpr std::size_t MAX_LABEL_LENGTH { 63 };
constexpr int MAX_POINTER_JUMPS { 32 };
constexpr uint8_t POINTER_MASK { 0xC0 };

namespace
{

class Writer
{
public:
    template <class T> void put(T value)
    {
        const auto offset = m_buf.size();
        m_buf.resize(offset + sizeof(T));
        BE_Put(m_buf.data() + offset, value);
    }

    void put_bytes(const std::vector<uint8_t>& bytes)
    {
        m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
    }

    void put_name(const std::string& name)
    {
        std::stringstream in { name };
        std::string label;
        while (std::getline(in, label, '.'))
        {
            if (label.empty())
            {
                continue;
            }
            if (label.size() > MAX_LABEL_LENGTH)
            {
                label.resize(MAX_LABEL_LENGTH);
            }
            m_buf.push_back(static_cast<uint8_t>(label.size()));
            m_buf.insert(m_buf.end(), label.begin(), label.end());
        }
        m_buf.push_back(0);
    }

    std::vector<uint8_t>& buffer() { return m_buf; }

private:
    std::vector<uint8_t> m_buf;
};

class Reader
{
public:
    Reader(const uint8_t* data, std::size_t size) : m_data(data), m_size(size) {}

    template <class T> bool get(T& value)
    {
        if (m_pos + sizeof(T) > m_size)
        {
            return false;
        }
        BE_Get(value, m_data + m_pos);
        m_pos += sizeof(T);
        return true;
    }

    bool get_name(std::string& name)
    {
        auto pos = m_pos;
        return read_name_at(pos, name, true);
    }

    /// Read a name starting at pos. When advance is set the reader position moves
    /// past the name as it appears inline (a pointer counts as two bytes).
    bool read_name_at(std::size_t pos, std::string& name, bool advance)
    {
        name.clear();
        bool jumped { false };
        int jumps { 0 };
        for (;;)
        {
            if (pos >= m_size)
            {
                return false;
            }
            const uint8_t len = m_data[pos];
            if ((len & POINTER_MASK) == POINTER_MASK)
            {
                if (pos + 1 >= m_size || ++jumps > MAX_POINTER_JUMPS)
                {
                    return false;
                }
                const std::size_t target = ((len & ~POINTER_MASK) << 8) | m_data[pos + 1];
                if (!jumped && advance)
                {
                    m_pos = pos + 2;
                }
                jumped = true;
                pos = target;
                continue;
            }
            if (len == 0)
            {
                if (!jumped && advance)
                {
                    m_pos = pos + 1;
                }
                return true;
            }
            if (pos + 1 + len > m_size)
            {
                return false;
            }
            if (!name.empty())
            {
                name += '.';
            }
            name.append(reinterpret_cast<const char*>(m_data + pos + 1), len);
            pos += 1 + len;
        }
    }

    bool skip(std::size_t count)
    {
        if (m_pos + count > m_size)
        {
            return false;
        }
        m_pos += count;
        return true;
    }

    bool remaining(std::size_t count) const { return m_pos + count <= m_size; }
    std::size_t position() const { return m_pos; }
    const uint8_t* data() const { return m_data; }

private:
    const uint8_t* m_data;
    std::size_t m_size;
    std::size_t m_pos { 0 };
};

std::vector<uint8_t> encode_rdata(const DnsRecord& record)
{
    Writer w;
    if (auto ptr = std::get_if<PtrData>(&record.data))
    {
        w.put_name(ptr->target);
    }
    else if (auto srv = std::get_if<SrvData>(&record.data))
    {
        w.put(srv->priority);
        w.put(srv->weight);
        w.put(srv->port);
        w.put_name(srv->target);
    }
    else if (auto a = std::get_if<AData>(&record.data))
    {
        std::stringstream in { a->address };
        std::string octet;
        while (std::getline(in, octet, '.'))
        {
            w.put(static_cast<uint8_t>(std::stoi(octet)));
        }
    }
    else if (auto txt = std::get_if<TxtData>(&record.data))
    {
        for (const auto& [key, value] : txt->entries)
        {
            auto entry = value.empty() ? key : key + "=" + value;
            w.put(static_cast<uint8_t>(entry.size()));
            w.put_bytes({ entry.begin(), entry.end() });
        }
    }
    else if (auto raw = std::get_if<RawData>(&record.data))
    {
        w.put_bytes(raw->bytes);
    }
    return std::move(w.buffer());
}

bool decode_record(Reader& r, DnsRecord& record)
{
    uint16_t rdlength { 0 };
    if (!r.get_name(record.name) ||
        !r.get(record.type) ||
        !r.get(record.rclass) ||
        !r.get(record.ttl) ||
        !r.get(rdlength) ||
        !r.remaining(rdlength))
    {
        return false;
    }
    const auto start = r.position();
    switch (record.type)
    {
        case TYPE_PTR:
        {
            PtrData ptr;
            if (!r.read_name_at(start, ptr.target, false))
            {
                return false;
            }
            record.data = ptr;
            break;
        }
        case TYPE_SRV:
        {
            SrvData srv;
            if (rdlength < 7 || !r.get(srv.priority) || !r.get(srv.weight) || !r.get(srv.port) ||
                !r.read_name_at(r.position(), srv.target, false))
            {
                return false;
            }
            record.data = srv;
            break;
        }
        case TYPE_A:
        {
            if (rdlength != 4)
            {
                return false;
            }
            const uint8_t* p = r.data() + start;
            std::stringstream out;
            out << int(p[0]) << '.' << int(p[1]) << '.' << int(p[2]) << '.' << int(p[3]);
            record.data = AData { out.str() };
            break;
        }
        case TYPE_TXT:
        {
            TxtData txt;
            std::size_t pos = start;
            const std::size_t end = start + rdlength;
            while (pos < end)
            {
                const uint8_t len = r.data()[pos];
                if (pos + 1 + len > end)
                {
                    return false;
                }
                std::string entry(reinterpret_cast<const char*>(r.data() + pos + 1), len);
                pos += 1 + len;
                if (entry.empty())
                {
                    continue;
                }
                auto eq = entry.find('=');
                if (eq == std::string::npos)
                {
                    txt.entries[entry] = "";
                }
                else
                {
                    txt.entries[entry.substr(0, eq)] = entry.substr(eq + 1);
                }
            }
            record.data = txt;
            break;
        }
        default:
            record.data = RawData { std::vector<uint8_t>(r.data() + start, r.data() + start + rdlength) };
            break;
    }
    // Reposition to the end of the rdata regardless of how much was consumed above.
    return r.skip(start + rdlength - r.position());
}

} // namespace


std::vector<DnsRecord> DnsMessage::all_records() const
{
    std::vector<DnsRecord> result { answers };
    result.insert(result.end(), authorities.begin(), authorities.end());
    result.insert(result.end(), additionals.begin(), additionals.end());
    return result;
}

std::vector<uint8_t> DnsMessage::encode() const
{
    Writer w;
    w.put(id);
    w.put(flags);
    w.put(static_cast<uint16_t>(questions.size()));
    w.put(static_cast<uint16_t>(answers.size()));
    w.put(static_cast<uint16_t>(authorities.size()));
    w.put(static_cast<uint16_t>(additionals.size()));
    for (const auto& q : questions)
    {
        w.put_name(q.name);
        w.put(q.type);
        w.put(static_cast<uint16_t>(CLASS_IN | (q.unicast_response ? 0x8000 : 0)));
    }
    for (const auto* section : { &answers, &authorities, &additionals })
    {
        for (const auto& record : *section)
        {
            auto rdata = encode_rdata(record);
            w.put_name(record.name);
            w.put(record.type);
            w.put(record.rclass);
            w.put(record.ttl);
            w.put(static_cast<uint16_t>(rdata.size()));
            w.put_bytes(rdata);
        }
    }
    return std::move(w.buffer());
}

std::optional<DnsMessage> DnsMessage::decode(const uint8_t* data, std::size_t size)
{
    if (data == nullptr || size < HEADER_SIZE)
    {
        return std::nullopt;
    }
    Reader r { data, size };
    DnsMessage msg;
    uint16_t qdcount {}, ancount {}, nscount {}, arcount {};
    if (!r.get(msg.id) || !r.get(msg.flags) || !r.get(qdcount) ||
        !r.get(ancount) || !r.get(nscount) || !r.get(arcount))
    {
        return std::nullopt;
    }
    for (uint16_t i = 0; i < qdcount; ++i)
    {
        DnsQuestion q;
        uint16_t qclass { 0 };
        if (!r.get_name(q.name) || !r.get(q.type) || !r.get(qclass))
        {
            return std::nullopt;
        }
        q.unicast_response = (qclass & 0x8000) != 0;
        msg.questions.push_back(q);
    }
    const std::pair<std::vector<DnsRecord>*, uint16_t> sections[] {
        { &msg.answers, ancount }, { &msg.authorities, nscount }, { &msg.additionals, arcount }
    };
    for (const auto& [section, count] : sections)
    {
        for (uint16_t i = 0; i < count; ++i)
        {
            DnsRecord record;
            if (!decode_record(r, record))
            {
                return std::nullopt;
            }
            section->push_back(record);
        }
    }
    return msg;
}

DnsMessage make_ptr_query(const std::vector<std::string>& service_types)
{
    DnsMessage msg;
    for (const auto& type : service_types)
    {
        msg.questions.push_back({ type, TYPE_PTR, false });
    }
    return msg;
}

} // namespace mdns
} // namespace camscout
