#include <algorithm>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <core/network/mdns/dns_message.h>

namespace castscout::core::mdns {

namespace {

constexpr std::size_t kHeaderSize = 12;
// root name (1) + type, class, ttl, rdlength (10)
constexpr std::size_t kMinRecordSize = 11;
constexpr int kMaxPointerJumps = 16;

class Reader {
public:
    Reader(const uint8_t* data, std::size_t size)
        : data_(data)
        , size_(size) {}

    std::size_t offset() const { return offset_; }
    void Seek(std::size_t offset) { offset_ = offset; }

    void Require(std::size_t count) const {
        if (offset_ + count > size_) {
            throw DnsParseError("truncated message");
        }
    }

    uint8_t U8() {
        Require(1);
        return data_[offset_++];
    }

    uint16_t U16() {
        Require(2);
        uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint32_t U32() {
        uint32_t high = U16();
        return (high << 16) | U16();
    }

    const uint8_t* Bytes(std::size_t count) {
        Require(count);
        const uint8_t* p = data_ + offset_;
        offset_ += count;
        return p;
    }

    // Follows compression pointers; the cursor ends after the name's first encoding.
    std::string Name() {
        std::string name;
        std::size_t cursor = offset_;
        std::size_t resume = 0;
        int jumps = 0;
        while (true) {
            if (cursor >= size_) {
                throw DnsParseError("name runs past end of message");
            }
            uint8_t length = data_[cursor];
            if ((length & 0xC0) == 0xC0) {
                if (cursor + 1 >= size_) {
                    throw DnsParseError("truncated compression pointer");
                }
                if (++jumps > kMaxPointerJumps) {
                    throw DnsParseError("compression pointer loop");
                }
                if (resume == 0) {
                    resume = cursor + 2;
                }
                cursor = static_cast<std::size_t>(((length & 0x3F) << 8) | data_[cursor + 1]);
                continue;
            }
            if ((length & 0xC0) != 0) {
                throw DnsParseError("unsupported label type");
            }
            ++cursor;
            if (length == 0) {
                break;
            }
            if (cursor + length > size_) {
                throw DnsParseError("label runs past end of message");
            }
            name.append(reinterpret_cast<const char*>(data_ + cursor), length);
            name.push_back('.');
            cursor += length;
        }
        offset_ = resume != 0 ? resume : cursor;
        return name.empty() ? "." : name;
    }

private:
    const uint8_t* data_;
    std::size_t size_;
    std::size_t offset_{0};
};

void writeU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeName(std::vector<uint8_t>& out, std::string_view name) {
    while (!name.empty()) {
        auto dot = name.find('.');
        auto label = name.substr(0, dot);
        if (label.empty() || label.size() > 63) {
            throw std::invalid_argument("invalid DNS label in name");
        }
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
        if (dot == std::string_view::npos) {
            break;
        }
        name.remove_prefix(dot + 1);
    }
    out.push_back(0);
}

ResourceRecord readRecord(Reader& reader, const uint8_t* data) {
    ResourceRecord record;
    record.name = reader.Name();
    record.type = reader.U16();
    uint16_t rclass = reader.U16();
    record.cache_flush = (rclass & 0x8000) != 0;
    record.rclass = rclass & 0x7FFF;
    record.ttl = reader.U32();
    uint16_t rdlength = reader.U16();
    reader.Require(rdlength);
    std::size_t rdata_start = reader.offset();
    std::size_t rdata_end = rdata_start + rdlength;

    switch (record.type) {
    case record_type::kPtr:
        record.ptr_name = reader.Name();
        break;
    case record_type::kSrv:
        record.srv.priority = reader.U16();
        record.srv.weight = reader.U16();
        record.srv.port = reader.U16();
        record.srv.target = reader.Name();
        break;
    case record_type::kTxt:
        while (reader.offset() < rdata_end) {
            uint8_t length = reader.U8();
            if (reader.offset() + length > rdata_end) {
                throw DnsParseError("TXT string runs past record");
            }
            if (length > 0) {
                record.txt.emplace_back(reinterpret_cast<const char*>(reader.Bytes(length)), length);
            }
        }
        break;
    case record_type::kA: {
        if (rdlength != 4) {
            throw DnsParseError("A record with bad length");
        }
        boost::asio::ip::address_v4::bytes_type bytes;
        std::copy_n(data + rdata_start, bytes.size(), bytes.begin());
        record.address = boost::asio::ip::address_v4(bytes);
        break;
    }
    case record_type::kAaaa: {
        if (rdlength != 16) {
            throw DnsParseError("AAAA record with bad length");
        }
        boost::asio::ip::address_v6::bytes_type bytes;
        std::copy_n(data + rdata_start, bytes.size(), bytes.begin());
        record.address = boost::asio::ip::address_v6(bytes);
        break;
    }
    default:
        break;
    }

    if (reader.offset() > rdata_end) {
        throw DnsParseError("record data overruns its length");
    }
    reader.Seek(rdata_end);
    return record;
}

} // namespace

std::vector<uint8_t> BuildQuery(const std::vector<Question>& questions) {
    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + questions.size() * 32);
    writeU16(out, 0); // mDNS queries carry id 0
    writeU16(out, 0); // standard query
    writeU16(out, static_cast<uint16_t>(questions.size()));
    writeU16(out, 0);
    writeU16(out, 0);
    writeU16(out, 0);
    for (const auto& question : questions) {
        writeName(out, question.name);
        writeU16(out, question.type);
        writeU16(out, kClassIn);
    }
    return out;
}

DnsMessage ParseMessage(const uint8_t* data, std::size_t size) {
    if (size < kHeaderSize) {
        throw DnsParseError("message shorter than header");
    }
    Reader reader(data, size);
    DnsMessage message;
    message.id = reader.U16();
    message.flags = reader.U16();
    uint16_t qdcount = reader.U16();
    uint16_t ancount = reader.U16();
    uint16_t nscount = reader.U16();
    uint16_t arcount = reader.U16();

    for (uint16_t i = 0; i < qdcount; ++i) {
        Question question;
        question.name = reader.Name();
        question.type = reader.U16();
        reader.U16(); // class
        message.questions.push_back(std::move(question));
    }

    std::size_t record_count = std::size_t{ancount} + nscount + arcount;
    // the counts are untrusted, never reserve more than the packet can hold
    message.records.reserve(std::min(record_count, (size - kHeaderSize) / kMinRecordSize));
    for (std::size_t i = 0; i < record_count; ++i) {
        message.records.push_back(readRecord(reader, data));
    }
    return message;
}

std::map<std::string, std::string> ParseTxtProperties(const std::vector<std::string>& entries) {
    std::map<std::string, std::string> properties;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == 0) {
            continue; // empty key
        }
        if (eq == std::string::npos) {
            properties.emplace(entry, "");
        } else {
            properties.emplace(entry.substr(0, eq), entry.substr(eq + 1));
        }
    }
    return properties;
}

} // namespace castscout::core::mdns
