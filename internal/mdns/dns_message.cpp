#include "dns_message.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace castproxy::mdns {

namespace {

constexpr size_t   kHeaderSize       = 12;
constexpr uint8_t  kPointerMask      = 0xC0;
constexpr uint16_t kMaxPointerTarget = 0x3FFF;

// ------------------------------------------------------------------
// Decoding
// ------------------------------------------------------------------

// A '.' or '\\' inside a label is written with a backslash in front so the
// dotted form keeps label boundaries; SplitLabels undoes it.
void AppendEscaped(std::string& out, const uint8_t* label, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    const char c = static_cast<char>(label[i]);
    if (c == '.' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
}

class Reader {
 public:
  Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {
  }

  size_t Position() const {
    return pos_;
  }

  void Require(size_t n, const char* what) const {
    if (pos_ + n > len_) {
      throw util::MalformedPacket(std::string("truncated ") + what + " at offset " + std::to_string(pos_));
    }
  }

  uint8_t U8() {
    Require(1, "octet");
    return data_[pos_++];
  }

  uint16_t U16() {
    Require(2, "u16");
    uint16_t v = static_cast<uint16_t>((uint16_t(data_[pos_]) << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
  }

  uint32_t U32() {
    Require(4, "u32");
    uint32_t v = (uint32_t(data_[pos_]) << 24) | (uint32_t(data_[pos_ + 1]) << 16) | (uint32_t(data_[pos_ + 2]) << 8) | data_[pos_ + 3];
    pos_ += 4;
    return v;
  }

  void Skip(size_t n) {
    Require(n, "rdata");
    pos_ += n;
  }

  const uint8_t* Here() const {
    return data_ + pos_;
  }

  // Reads a possibly-compressed name starting at the cursor. Every
  // compression pointer must point strictly backwards, which bounds the
  // walk and rejects loops.
  std::string Name() {
    std::string out;
    size_t      cursor      = pos_;
    size_t      lower_bound = pos_;
    bool        jumped      = false;
    size_t      wire_length = 0;

    while (true) {
      if (cursor >= len_) {
        throw util::MalformedPacket("name runs past end of packet");
      }
      const uint8_t label = data_[cursor];

      if ((label & kPointerMask) == kPointerMask) {
        if (cursor + 1 >= len_) {
          throw util::MalformedPacket("truncated compression pointer");
        }
        const size_t target = (size_t(label & 0x3F) << 8) | data_[cursor + 1];
        if (target >= lower_bound) {
          throw util::MalformedPacket("compression pointer does not point backwards");
        }
        if (!jumped) {
          pos_   = cursor + 2;
          jumped = true;
        }
        lower_bound = target;
        cursor      = target;
        continue;
      }

      if ((label & kPointerMask) != 0) {
        throw util::MalformedPacket("reserved label type");
      }

      if (label == 0) {
        if (!jumped) {
          pos_ = cursor + 1;
        }
        return out;
      }

      if (cursor + 1 + label > len_) {
        throw util::MalformedPacket("label runs past end of packet");
      }
      wire_length += label + 1;
      if (wire_length + 1 > kMaxNameLength) {
        throw util::MalformedPacket("name longer than 255 octets");
      }
      if (!out.empty()) {
        out.push_back('.');
      }
      AppendEscaped(out, data_ + cursor + 1, label);
      cursor += 1 + label;
    }
  }

 private:
  const uint8_t* data_;
  size_t         len_;
  size_t         pos_ = 0;
};

Question ReadQuestion(Reader& r) {
  Question q;
  q.name  = r.Name();
  q.type  = r.U16();
  q.klass = r.U16();
  return q;
}

RecordData ReadRecordData(Reader& r, uint16_t type, uint16_t rdlength) {
  const size_t start = r.Position();
  const size_t end   = start + rdlength;
  r.Require(rdlength, "rdata");

  auto ensure_within = [&](const char* what) {
    if (r.Position() > end) {
      throw util::MalformedPacket(std::string(what) + " overruns its rdata");
    }
  };

  switch (type) {
    case kTypeA: {
      if (rdlength != 4) {
        throw util::MalformedPacket("A record with rdlength " + std::to_string(rdlength));
      }
      AData a;
      for (auto& octet : a.address) {
        octet = r.U8();
      }
      return a;
    }

    case kTypePTR: {
      PtrData ptr;
      ptr.target = r.Name();
      ensure_within("PTR target");
      r.Skip(end - r.Position());
      return ptr;
    }

    case kTypeSRV: {
      if (rdlength < 7) {
        throw util::MalformedPacket("SRV record too short");
      }
      SrvData srv;
      srv.priority = r.U16();
      srv.weight   = r.U16();
      srv.port     = r.U16();
      srv.target   = r.Name();
      ensure_within("SRV target");
      r.Skip(end - r.Position());
      return srv;
    }

    case kTypeTXT: {
      TxtData txt;
      while (r.Position() < end) {
        const uint8_t n = r.U8();
        if (r.Position() + n > end) {
          throw util::MalformedPacket("TXT string overruns its rdata");
        }
        txt.entries.emplace_back(reinterpret_cast<const char*>(r.Here()), n);
        r.Skip(n);
      }
      return txt;
    }

    default: {
      RawData raw;
      raw.bytes.assign(r.Here(), r.Here() + rdlength);
      r.Skip(rdlength);
      return raw;
    }
  }
}

ResourceRecord ReadRecord(Reader& r) {
  ResourceRecord rr;
  rr.name  = r.Name();
  rr.type  = r.U16();
  rr.klass = r.U16();
  rr.ttl   = r.U32();

  const uint16_t rdlength = r.U16();
  rr.data                 = ReadRecordData(r, rr.type, rdlength);
  return rr;
}

// ------------------------------------------------------------------
// Encoding
// ------------------------------------------------------------------

std::vector<std::string> SplitLabels(const std::string& name) {
  std::vector<std::string> labels;
  std::string              current;
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (c == '\\') {
      if (i + 1 == name.size()) {
        throw std::invalid_argument("dangling escape in name: " + name);
      }
      current.push_back(name[++i]);
    } else if (c == '.') {
      if (current.empty()) {
        // trailing dots end the name
        if (name.find_first_not_of('.', i) == std::string::npos) break;
        throw std::invalid_argument("empty label in name: " + name);
      }
      labels.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    labels.push_back(std::move(current));
  }
  return labels;
}

class Writer {
 public:
  void U8(uint8_t v) {
    out_.push_back(v);
  }

  void U16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v >> 8));
    out_.push_back(static_cast<uint8_t>(v & 0xFF));
  }

  void U32(uint32_t v) {
    U16(static_cast<uint16_t>(v >> 16));
    U16(static_cast<uint16_t>(v & 0xFFFF));
  }

  void Bytes(const void* data, size_t n) {
    const auto* p = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), p, p + n);
  }

  size_t Size() const {
    return out_.size();
  }

  void PatchU16(size_t at, uint16_t v) {
    out_[at]     = static_cast<uint8_t>(v >> 8);
    out_[at + 1] = static_cast<uint8_t>(v & 0xFF);
  }

  // Writes `name`, reusing any suffix already written in this message.
  void Name(const std::string& name, bool allow_compression) {
    const auto labels = SplitLabels(name);

    size_t wire_length = 1;
    for (const auto& label : labels) {
      if (label.size() > kMaxLabelLength) {
        throw std::invalid_argument("label longer than 63 octets in name: " + name);
      }
      wire_length += label.size() + 1;
    }
    if (wire_length > kMaxNameLength) {
      throw std::invalid_argument("name longer than 255 octets: " + name);
    }

    for (size_t i = 0; i < labels.size(); ++i) {
      std::string suffix;
      for (size_t j = i; j < labels.size(); ++j) {
        if (!suffix.empty()) suffix.push_back('.');
        AppendEscaped(suffix, reinterpret_cast<const uint8_t*>(labels[j].data()), labels[j].size());
      }
      const std::string key = CanonicalName(suffix);

      if (allow_compression) {
        auto it = suffixes_.find(key);
        if (it != suffixes_.end()) {
          U16(static_cast<uint16_t>(0xC000 | it->second));
          return;
        }
      }
      if (out_.size() <= kMaxPointerTarget) {
        suffixes_.try_emplace(key, static_cast<uint16_t>(out_.size()));
      }

      U8(static_cast<uint8_t>(labels[i].size()));
      Bytes(labels[i].data(), labels[i].size());
    }
    U8(0);
  }

  std::vector<uint8_t> Take() {
    return std::move(out_);
  }

 private:
  std::vector<uint8_t>                      out_;
  std::unordered_map<std::string, uint16_t> suffixes_;
};

void WriteRecordData(Writer& w, const ResourceRecord& rr) {
  if (const auto* a = std::get_if<AData>(&rr.data)) {
    w.Bytes(a->address.data(), a->address.size());
  } else if (const auto* ptr = std::get_if<PtrData>(&rr.data)) {
    w.Name(ptr->target, true);
  } else if (const auto* srv = std::get_if<SrvData>(&rr.data)) {
    w.U16(srv->priority);
    w.U16(srv->weight);
    w.U16(srv->port);
    // left uncompressed for resolvers that follow RFC 2782 strictly
    w.Name(srv->target, false);
  } else if (const auto* txt = std::get_if<TxtData>(&rr.data)) {
    if (txt->entries.empty()) {
      // RFC 6763 section 6.1: an empty TXT record is a single zero byte
      w.U8(0);
    }
    for (const auto& entry : txt->entries) {
      const size_t n = std::min<size_t>(entry.size(), 255);
      w.U8(static_cast<uint8_t>(n));
      w.Bytes(entry.data(), n);
    }
  } else if (const auto* raw = std::get_if<RawData>(&rr.data)) {
    w.Bytes(raw->bytes.data(), raw->bytes.size());
  }
}

void WriteRecord(Writer& w, const ResourceRecord& rr) {
  w.Name(rr.name, true);
  w.U16(rr.type);
  w.U16(rr.klass);
  w.U32(rr.ttl);

  const size_t length_at = w.Size();
  w.U16(0);
  WriteRecordData(w, rr);

  const size_t rdlength = w.Size() - length_at - 2;
  if (rdlength > 0xFFFF) {
    throw std::invalid_argument("rdata too long for record " + rr.name);
  }
  w.PatchU16(length_at, static_cast<uint16_t>(rdlength));
}

} // namespace

Message Decode(const uint8_t* data, size_t len) {
  if (data == nullptr || len < kHeaderSize) {
    throw util::MalformedPacket("packet shorter than DNS header");
  }

  Reader  r(data, len);
  Message m;
  m.id    = r.U16();
  m.flags = r.U16();

  const uint16_t qdcount = r.U16();
  const uint16_t ancount = r.U16();
  const uint16_t nscount = r.U16();
  const uint16_t arcount = r.U16();

  for (uint16_t i = 0; i < qdcount; ++i) {
    m.questions.push_back(ReadQuestion(r));
  }
  for (uint16_t i = 0; i < ancount; ++i) {
    m.answers.push_back(ReadRecord(r));
  }
  for (uint16_t i = 0; i < nscount; ++i) {
    m.authorities.push_back(ReadRecord(r));
  }
  for (uint16_t i = 0; i < arcount; ++i) {
    m.additionals.push_back(ReadRecord(r));
  }

  return m;
}

Message Decode(const std::vector<uint8_t>& bytes) {
  return Decode(bytes.data(), bytes.size());
}

std::vector<uint8_t> Encode(const Message& message) {
  auto count = [](size_t n, const char* section) {
    if (n > 0xFFFF) {
      throw std::invalid_argument(std::string("too many entries in ") + section);
    }
    return static_cast<uint16_t>(n);
  };

  Writer w;
  w.U16(message.id);
  w.U16(message.flags);
  w.U16(count(message.questions.size(), "questions"));
  w.U16(count(message.answers.size(), "answers"));
  w.U16(count(message.authorities.size(), "authorities"));
  w.U16(count(message.additionals.size(), "additionals"));

  for (const auto& q : message.questions) {
    w.Name(q.name, true);
    w.U16(q.type);
    w.U16(q.klass);
  }
  for (const auto& rr : message.answers) {
    WriteRecord(w, rr);
  }
  for (const auto& rr : message.authorities) {
    WriteRecord(w, rr);
  }
  for (const auto& rr : message.additionals) {
    WriteRecord(w, rr);
  }

  return w.Take();
}

ResourceRecord MakePtr(const std::string& name, uint32_t ttl, const std::string& target) {
  return {name, kTypePTR, kClassIN, ttl, PtrData{target}};
}

ResourceRecord MakeTxt(const std::string& name, uint32_t ttl, std::vector<std::string> entries) {
  return {name, kTypeTXT, kClassIN, ttl, TxtData{std::move(entries)}};
}

ResourceRecord MakeSrv(const std::string& name, uint32_t ttl, uint16_t port, const std::string& target) {
  return {name, kTypeSRV, kClassIN, ttl, SrvData{0, 0, port, target}};
}

ResourceRecord MakeA(const std::string& name, uint32_t ttl, const std::array<uint8_t, 4>& address) {
  return {name, kTypeA, kClassIN, ttl, AData{address}};
}

std::string CanonicalName(const std::string& name) {
  size_t n = name.size();
  while (n > 0 && name[n - 1] == '.') {
    --n;
  }
  std::string out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
  }
  return out;
}

bool NamesEqual(const std::string& a, const std::string& b) {
  return CanonicalName(a) == CanonicalName(b);
}

std::optional<std::array<uint8_t, 4>> ParseIPv4(const std::string& address) {
  in_addr parsed{};
  if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
    return std::nullopt;
  }
  std::array<uint8_t, 4> octets{};
  const auto*            bytes = reinterpret_cast<const uint8_t*>(&parsed.s_addr);
  for (size_t i = 0; i < octets.size(); ++i) {
    octets[i] = bytes[i];
  }
  return octets;
}

std::string FormatIPv4(const std::array<uint8_t, 4>& address) {
  return std::to_string(address[0]) + "." + std::to_string(address[1]) + "." + std::to_string(address[2]) + "." + std::to_string(address[3]);
}

} // namespace castproxy::mdns
