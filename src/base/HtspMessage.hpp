#ifndef __TVH_HTSP_MESSAGE__
#define __TVH_HTSP_MESSAGE__

#include "Headers.hpp"

namespace tvh {
enum HtspFieldType : uint8_t {
  HMF_MAP = 1,
  HMF_S64 = 2,
  HMF_STR = 3,
  HMF_BIN = 4,
  HMF_LIST = 5,
};

/**
 * @brief One named, typed value.  Maps and lists keep their members in
 * `children`; list members have an empty name.
 */
struct HtspField {
  HtspField() : type(HMF_S64), s64(0) {}
  HtspField(uint8_t _type, const string& _name)
      : type(_type), name(_name), s64(0) {}

  uint8_t type;
  string name;
  int64_t s64;
  /** @brief Payload of STR and BIN fields. */
  string bytes;
  vector<HtspField> children;
};

/**
 * @brief A protocol message: an ordered set of uniquely named fields.
 *
 * Requests and push events carry a `method` field; replies carry the `seq`
 * field copied from the request they answer.
 */
class HtspMessage {
 public:
  HtspMessage() {}
  explicit HtspMessage(const string& method) { setMethod(method); }

  inline string getMethod() const { return getString("method", ""); }
  inline void setMethod(const string& method) { putString("method", method); }

  bool hasField(const string& name) const;
  void removeField(const string& name);

  /**
   * @brief Setters replace any existing field with the same name.
   */
  void putS64(const string& name, int64_t value);
  void putString(const string& name, const string& value);
  void putBin(const string& name, const string& value);
  void putMessage(const string& name, const HtspMessage& value);
  void putMessageList(const string& name, const vector<HtspMessage>& values);
  void putS64List(const string& name, const vector<int64_t>& values);
  void putStringList(const string& name, const vector<string>& values);

  /**
   * @brief Reads an integer.  A string field holding a decimal number is
   * accepted as well; anything else yields `defaultValue`.
   */
  int64_t getS64(const string& name, int64_t defaultValue) const;
  inline int getInt(const string& name, int defaultValue) const {
    return int(getS64(name, defaultValue));
  }
  /**
   * @brief Reads a string.  Integer fields are rendered in decimal, which
   * lets ids that changed type between protocol versions read the same way.
   */
  string getString(const string& name, const string& defaultValue) const;
  string getBin(const string& name) const;
  bool getMessage(const string& name, HtspMessage* value) const;
  vector<HtspMessage> getMessageList(const string& name) const;
  vector<int64_t> getS64List(const string& name) const;
  vector<string> getStringList(const string& name) const;

  inline const vector<HtspField>& getFields() const { return fields; }
  inline vector<HtspField>* mutableFields() { return &fields; }

  /** @brief Human readable dump for verbose logs. */
  string toString() const;

 protected:
  const HtspField* findField(const string& name) const;
  HtspField* replaceField(uint8_t type, const string& name);

  vector<HtspField> fields;
};

inline ostream& operator<<(ostream& os, const HtspMessage& message) {
  return os << message.toString();
}
}  // namespace tvh

#endif  // __TVH_HTSP_MESSAGE__
