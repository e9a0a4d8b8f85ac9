#include "HtspMessage.hpp"

namespace tvh {
namespace {
void dumpField(const HtspField& field, int indent, ostringstream* oss) {
  *oss << string(indent * 2, ' ');
  if (!field.name.empty()) {
    *oss << field.name << ": ";
  }
  switch (field.type) {
    case HMF_S64:
      *oss << field.s64 << "\n";
      break;
    case HMF_STR:
      *oss << "\"" << field.bytes << "\"\n";
      break;
    case HMF_BIN:
      *oss << "<" << field.bytes.length() << " bytes>\n";
      break;
    case HMF_MAP:
    case HMF_LIST:
      *oss << (field.type == HMF_MAP ? "{" : "[") << "\n";
      for (const auto& child : field.children) {
        dumpField(child, indent + 1, oss);
      }
      *oss << string(indent * 2, ' ') << (field.type == HMF_MAP ? "}" : "]")
           << "\n";
      break;
    default:
      *oss << "<type " << int(field.type) << ">\n";
  }
}
}  // namespace

bool HtspMessage::hasField(const string& name) const {
  return findField(name) != NULL;
}

void HtspMessage::removeField(const string& name) {
  fields.erase(std::remove_if(fields.begin(), fields.end(),
                              [&name](const HtspField& field) {
                                return field.name == name;
                              }),
               fields.end());
}

void HtspMessage::putS64(const string& name, int64_t value) {
  replaceField(HMF_S64, name)->s64 = value;
}

void HtspMessage::putString(const string& name, const string& value) {
  replaceField(HMF_STR, name)->bytes = value;
}

void HtspMessage::putBin(const string& name, const string& value) {
  replaceField(HMF_BIN, name)->bytes = value;
}

void HtspMessage::putMessage(const string& name, const HtspMessage& value) {
  replaceField(HMF_MAP, name)->children = value.fields;
}

void HtspMessage::putMessageList(const string& name,
                                 const vector<HtspMessage>& values) {
  HtspField* field = replaceField(HMF_LIST, name);
  for (const auto& value : values) {
    HtspField member(HMF_MAP, "");
    member.children = value.fields;
    field->children.push_back(member);
  }
}

void HtspMessage::putS64List(const string& name,
                             const vector<int64_t>& values) {
  HtspField* field = replaceField(HMF_LIST, name);
  for (int64_t value : values) {
    HtspField member(HMF_S64, "");
    member.s64 = value;
    field->children.push_back(member);
  }
}

void HtspMessage::putStringList(const string& name,
                                const vector<string>& values) {
  HtspField* field = replaceField(HMF_LIST, name);
  for (const auto& value : values) {
    HtspField member(HMF_STR, "");
    member.bytes = value;
    field->children.push_back(member);
  }
}

int64_t HtspMessage::getS64(const string& name, int64_t defaultValue) const {
  const HtspField* field = findField(name);
  if (field == NULL) {
    return defaultValue;
  }
  if (field->type == HMF_S64) {
    return field->s64;
  }
  if (field->type == HMF_STR && !field->bytes.empty()) {
    char* end = NULL;
    long long value = strtoll(field->bytes.c_str(), &end, 10);
    if (end != NULL && *end == '\0') {
      return value;
    }
  }
  return defaultValue;
}

string HtspMessage::getString(const string& name,
                              const string& defaultValue) const {
  const HtspField* field = findField(name);
  if (field == NULL) {
    return defaultValue;
  }
  if (field->type == HMF_STR) {
    return field->bytes;
  }
  if (field->type == HMF_S64) {
    return to_string(field->s64);
  }
  return defaultValue;
}

string HtspMessage::getBin(const string& name) const {
  const HtspField* field = findField(name);
  if (field == NULL ||
      (field->type != HMF_BIN && field->type != HMF_STR)) {
    return "";
  }
  return field->bytes;
}

bool HtspMessage::getMessage(const string& name, HtspMessage* value) const {
  const HtspField* field = findField(name);
  if (field == NULL || field->type != HMF_MAP) {
    return false;
  }
  value->fields = field->children;
  return true;
}

vector<HtspMessage> HtspMessage::getMessageList(const string& name) const {
  vector<HtspMessage> retval;
  const HtspField* field = findField(name);
  if (field == NULL || field->type != HMF_LIST) {
    return retval;
  }
  for (const auto& member : field->children) {
    if (member.type != HMF_MAP) {
      continue;
    }
    HtspMessage m;
    m.fields = member.children;
    retval.push_back(m);
  }
  return retval;
}

vector<int64_t> HtspMessage::getS64List(const string& name) const {
  vector<int64_t> retval;
  const HtspField* field = findField(name);
  if (field == NULL || field->type != HMF_LIST) {
    return retval;
  }
  for (const auto& member : field->children) {
    if (member.type == HMF_S64) {
      retval.push_back(member.s64);
    }
  }
  return retval;
}

vector<string> HtspMessage::getStringList(const string& name) const {
  vector<string> retval;
  const HtspField* field = findField(name);
  if (field == NULL || field->type != HMF_LIST) {
    return retval;
  }
  for (const auto& member : field->children) {
    if (member.type == HMF_STR) {
      retval.push_back(member.bytes);
    }
  }
  return retval;
}

string HtspMessage::toString() const {
  ostringstream oss;
  oss << "{\n";
  for (const auto& field : fields) {
    dumpField(field, 1, &oss);
  }
  oss << "}";
  return oss.str();
}

const HtspField* HtspMessage::findField(const string& name) const {
  for (const auto& field : fields) {
    if (field.name == name) {
      return &field;
    }
  }
  return NULL;
}

HtspField* HtspMessage::replaceField(uint8_t type, const string& name) {
  for (auto& field : fields) {
    if (field.name == name) {
      field = HtspField(type, name);
      return &field;
    }
  }
  fields.push_back(HtspField(type, name));
  return &fields.back();
}
}  // namespace tvh
