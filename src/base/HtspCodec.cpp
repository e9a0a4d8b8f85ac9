#include "HtspCodec.hpp"

namespace tvh {
namespace {
const int MAX_NESTING_DEPTH = 32;
const size_t FIELD_HEADER_SIZE = 6;

inline void appendU32(uint32_t value, string* out) {
  out->push_back(char((value >> 24) & 0xFF));
  out->push_back(char((value >> 16) & 0xFF));
  out->push_back(char((value >> 8) & 0xFF));
  out->push_back(char(value & 0xFF));
}

inline uint32_t readU32(const char* p) {
  const unsigned char* u = (const unsigned char*)p;
  return (uint32_t(u[0]) << 24) | (uint32_t(u[1]) << 16) |
         (uint32_t(u[2]) << 8) | uint32_t(u[3]);
}

string encodeS64(int64_t value) {
  string s;
  uint64_t u = uint64_t(value);
  while (u != 0) {
    s.push_back(char(u & 0xFF));
    u >>= 8;
  }
  return s;
}
}  // namespace

string HtspCodec::serialize(const HtspMessage& message) {
  string out;
  serializeFields(message.getFields(), &out);
  return out;
}

HtspMessage HtspCodec::deserialize(const string& body) {
  HtspMessage message;
  deserializeFields(body.data(), body.length(), message.mutableFields(), 0);
  return message;
}

void HtspCodec::serializeFields(const vector<HtspField>& fields, string* out) {
  for (const auto& field : fields) {
    if (field.name.length() > 255) {
      STFATAL << "Field name too long: " << field.name;
    }
    string data;
    switch (field.type) {
      case HMF_S64:
        data = encodeS64(field.s64);
        break;
      case HMF_STR:
      case HMF_BIN:
        data = field.bytes;
        break;
      case HMF_MAP:
      case HMF_LIST:
        serializeFields(field.children, &data);
        break;
      default:
        STFATAL << "Invalid field type: " << int(field.type);
    }
    out->push_back(char(field.type));
    out->push_back(char(field.name.length()));
    appendU32(uint32_t(data.length()), out);
    out->append(field.name);
    out->append(data);
  }
}

void HtspCodec::deserializeFields(const char* data, size_t length,
                                  vector<HtspField>* out, int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    throw ProtocolError("Message nesting too deep");
  }
  size_t pos = 0;
  while (pos < length) {
    if (length - pos < FIELD_HEADER_SIZE) {
      throw ProtocolError("Truncated field header");
    }
    uint8_t type = uint8_t(data[pos]);
    size_t nameLength = uint8_t(data[pos + 1]);
    size_t dataLength = readU32(data + pos + 2);
    pos += FIELD_HEADER_SIZE;
    if (length - pos < nameLength || length - pos - nameLength < dataLength) {
      throw ProtocolError("Truncated field body");
    }
    HtspField field(type, string(data + pos, nameLength));
    pos += nameLength;
    const char* fieldData = data + pos;
    switch (type) {
      case HMF_S64: {
        if (dataLength > 8) {
          throw ProtocolError("Integer field longer than 8 bytes: " +
                              field.name);
        }
        uint64_t u = 0;
        for (size_t i = 0; i < dataLength; i++) {
          u |= uint64_t(uint8_t(fieldData[i])) << (i * 8);
        }
        field.s64 = int64_t(u);
        break;
      }
      case HMF_STR:
      case HMF_BIN:
        field.bytes = string(fieldData, dataLength);
        break;
      case HMF_MAP:
      case HMF_LIST:
        deserializeFields(fieldData, dataLength, &field.children, depth + 1);
        break;
      default:
        throw ProtocolError("Unknown field type " + to_string(int(type)) +
                            " for field " + field.name);
    }
    pos += dataLength;
    out->push_back(field);
  }
}
}  // namespace tvh
