/**
 * @file mdns_packet.cpp
 * @brief Multicast DNS message encoding and decoding
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#include "mdns_packet.hpp"

#include <cctype>
#include <utility>

namespace sumo_mitm::discovery {

namespace {

/// Compression pointers followed before giving up
constexpr int MAX_POINTER_DEPTH = 20;

uint16_t rd16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t rd32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

void wr16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void wr32(std::vector<uint8_t>& out, uint32_t value) {
    wr16(out, static_cast<uint16_t>(value >> 16));
    wr16(out, static_cast<uint16_t>(value & 0xFFFF));
}

bool encode_rdata(const DnsRecord& record, std::vector<uint8_t>& out) {
    switch (static_cast<DnsType>(record.type)) {
        case DnsType::PTR:
            return encode_name(record.target, out);

        case DnsType::SRV:
            wr16(out, record.priority);
            wr16(out, record.weight);
            wr16(out, record.port);
            return encode_name(record.target, out);

        case DnsType::TXT:
            // An empty TXT record still carries one zero-length string
            if (record.txt.empty()) {
                out.push_back(0);
                return true;
            }
            for (const std::string& entry : record.txt) {
                if (entry.size() > 255) {
                    return false;
                }
                out.push_back(static_cast<uint8_t>(entry.size()));
                out.insert(out.end(), entry.begin(), entry.end());
            }
            return true;

        case DnsType::A:
            wr32(out, record.address);
            return true;

        default:
            return false;
    }
}

bool encode_record(const DnsRecord& record, std::vector<uint8_t>& out) {
    if (!encode_name(record.name, out)) {
        return false;
    }
    wr16(out, record.type);
    wr16(out, record.klass);
    wr32(out, record.ttl);

    size_t length_offset = out.size();
    wr16(out, 0);

    if (!encode_rdata(record, out)) {
        return false;
    }

    size_t rdlength = out.size() - length_offset - 2;
    if (rdlength > 0xFFFF) {
        return false;
    }
    out[length_offset] = static_cast<uint8_t>(rdlength >> 8);
    out[length_offset + 1] = static_cast<uint8_t>(rdlength & 0xFF);
    return true;
}

bool decode_record(const uint8_t* data, size_t size, size_t& offset, DnsRecord& record) {
    if (!read_name(data, size, offset, record.name)) {
        return false;
    }
    if (offset + 10 > size) {
        return false;
    }

    record.type = rd16(data + offset);
    record.klass = rd16(data + offset + 2);
    record.ttl = rd32(data + offset + 4);
    uint16_t rdlength = rd16(data + offset + 8);
    offset += 10;

    if (offset + rdlength > size) {
        return false;
    }
    const size_t rdata = offset;
    const size_t rdata_end = offset + rdlength;
    offset = rdata_end;

    // Only IN-class rdata is interpreted
    if ((record.klass & DNS_CLASS_MASK) != DNS_CLASS_IN) {
        return true;
    }

    size_t pos = rdata;
    switch (static_cast<DnsType>(record.type)) {
        case DnsType::PTR:
            return read_name(data, size, pos, record.target) && pos <= rdata_end;

        case DnsType::SRV:
            if (rdlength < 7) {
                return false;
            }
            record.priority = rd16(data + rdata);
            record.weight = rd16(data + rdata + 2);
            record.port = rd16(data + rdata + 4);
            pos = rdata + 6;
            return read_name(data, size, pos, record.target) && pos <= rdata_end;

        case DnsType::TXT:
            while (pos < rdata_end) {
                uint8_t length = data[pos++];
                if (pos + length > rdata_end) {
                    return false;
                }
                if (length > 0) {
                    record.txt.emplace_back(reinterpret_cast<const char*>(data + pos), length);
                }
                pos += length;
            }
            return true;

        case DnsType::A:
            if (rdlength != 4) {
                return false;
            }
            record.address = rd32(data + rdata);
            return true;

        default:
            return true;
    }
}

bool decode_records(const uint8_t* data, size_t size, size_t& offset,
                    uint16_t count, std::vector<DnsRecord>& records) {
    records.reserve(count);
    for (uint16_t i = 0; i < count; i++) {
        DnsRecord record;
        if (!decode_record(data, size, offset, record)) {
            return false;
        }
        records.push_back(std::move(record));
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Record builders
// ============================================================================

DnsRecord make_ptr_record(const std::string& name, const std::string& target, uint32_t ttl) {
    DnsRecord record;
    record.name = name;
    record.type = static_cast<uint16_t>(DnsType::PTR);
    record.klass = DNS_CLASS_IN;   // shared record, never cache-flush
    record.ttl = ttl;
    record.target = target;
    return record;
}

DnsRecord make_srv_record(const std::string& name, const std::string& target,
                          uint16_t port, uint32_t ttl) {
    DnsRecord record;
    record.name = name;
    record.type = static_cast<uint16_t>(DnsType::SRV);
    record.klass = DNS_CLASS_IN | MDNS_CACHE_FLUSH;
    record.ttl = ttl;
    record.target = target;
    record.port = port;
    return record;
}

DnsRecord make_txt_record(const std::string& name, uint32_t ttl) {
    DnsRecord record;
    record.name = name;
    record.type = static_cast<uint16_t>(DnsType::TXT);
    record.klass = DNS_CLASS_IN | MDNS_CACHE_FLUSH;
    record.ttl = ttl;
    return record;
}

DnsRecord make_a_record(const std::string& name, uint32_t address, uint32_t ttl) {
    DnsRecord record;
    record.name = name;
    record.type = static_cast<uint16_t>(DnsType::A);
    record.klass = DNS_CLASS_IN | MDNS_CACHE_FLUSH;
    record.ttl = ttl;
    record.address = address;
    return record;
}

// ============================================================================
// Names
// ============================================================================

std::string canonical_name(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    while (!result.empty() && result.back() == '.') {
        result.pop_back();
    }
    return result;
}

bool encode_name(const std::string& name, std::vector<uint8_t>& out) {
    size_t start = 0;
    size_t end = name.size();
    if (end > 0 && name[end - 1] == '.') {
        end--;
    }

    size_t encoded = 1;
    while (start < end) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos || dot > end) {
            dot = end;
        }

        size_t length = dot - start;
        if (length == 0 || length > DNS_MAX_LABEL_LENGTH) {
            return false;
        }
        encoded += length + 1;
        if (encoded > DNS_MAX_NAME_LENGTH) {
            return false;
        }

        out.push_back(static_cast<uint8_t>(length));
        out.insert(out.end(), name.begin() + start, name.begin() + dot);
        start = dot + 1;
    }

    out.push_back(0);
    return true;
}

bool read_name(const uint8_t* data, size_t size, size_t& offset, std::string& name) {
    name.clear();

    size_t pos = offset;
    bool jumped = false;
    int depth = 0;

    for (;;) {
        if (pos >= size) {
            return false;
        }

        uint8_t length = data[pos];
        if (length == 0) {
            if (!jumped) {
                offset = pos + 1;
            }
            return true;
        }

        if ((length & 0xC0) == 0xC0) {
            if (pos + 1 >= size || ++depth > MAX_POINTER_DEPTH) {
                return false;
            }
            if (!jumped) {
                offset = pos + 2;
            }
            pos = static_cast<size_t>(((length & 0x3F) << 8) | data[pos + 1]);
            jumped = true;
            continue;
        }

        if ((length & 0xC0) != 0) {
            return false;   // 0x40/0x80 label types are obsolete
        }

        pos++;
        if (pos + length > size) {
            return false;
        }
        if (!name.empty()) {
            name.push_back('.');
        }
        name.append(reinterpret_cast<const char*>(data + pos), length);
        if (name.size() > DNS_MAX_NAME_LENGTH) {
            return false;
        }
        pos += length;
    }
}

// ============================================================================
// Messages
// ============================================================================

bool encode_message(const DnsMessage& message, std::vector<uint8_t>& out) {
    if (message.questions.size() > 0xFFFF || message.answers.size() > 0xFFFF ||
        message.authorities.size() > 0xFFFF || message.additionals.size() > 0xFFFF) {
        return false;
    }

    out.clear();
    wr16(out, message.id);
    wr16(out, message.flags);
    wr16(out, static_cast<uint16_t>(message.questions.size()));
    wr16(out, static_cast<uint16_t>(message.answers.size()));
    wr16(out, static_cast<uint16_t>(message.authorities.size()));
    wr16(out, static_cast<uint16_t>(message.additionals.size()));

    for (const DnsQuestion& question : message.questions) {
        if (!encode_name(question.name, out)) {
            return false;
        }
        wr16(out, question.type);
        wr16(out, question.klass);
    }

    for (const std::vector<DnsRecord>* section :
         {&message.answers, &message.authorities, &message.additionals}) {
        for (const DnsRecord& record : *section) {
            if (!encode_record(record, out)) {
                return false;
            }
        }
    }

    return out.size() <= MDNS_MAX_PACKET_SIZE;
}

bool decode_message(const uint8_t* data, size_t size, DnsMessage& message) {
    message = DnsMessage{};
    if (data == nullptr || size < DNS_HEADER_SIZE) {
        return false;
    }

    message.id = rd16(data);
    message.flags = rd16(data + 2);
    uint16_t qdcount = rd16(data + 4);
    uint16_t ancount = rd16(data + 6);
    uint16_t nscount = rd16(data + 8);
    uint16_t arcount = rd16(data + 10);

    size_t offset = DNS_HEADER_SIZE;
    for (uint16_t i = 0; i < qdcount; i++) {
        DnsQuestion question;
        if (!read_name(data, size, offset, question.name) || offset + 4 > size) {
            return false;
        }
        question.type = rd16(data + offset);
        question.klass = rd16(data + offset + 2);
        offset += 4;
        message.questions.push_back(std::move(question));
    }

    return decode_records(data, size, offset, ancount, message.answers) &&
           decode_records(data, size, offset, nscount, message.authorities) &&
           decode_records(data, size, offset, arcount, message.additionals);
}

const char* dns_type_to_string(uint16_t type) {
    switch (static_cast<DnsType>(type)) {
        case DnsType::A:   return "A";
        case DnsType::PTR: return "PTR";
        case DnsType::TXT: return "TXT";
        case DnsType::SRV: return "SRV";
        case DnsType::ANY: return "ANY";
        default:           return "?";
    }
}

} // namespace sumo_mitm::discovery
