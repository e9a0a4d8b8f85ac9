#ifndef __TVH_HTSP_CODEC__
#define __TVH_HTSP_CODEC__

#include "Headers.hpp"
#include "HtspErrors.hpp"
#include "HtspMessage.hpp"

namespace tvh {
/**
 * @brief Converts messages to and from the binary field encoding.
 *
 * Each field is `type:u8 nameLength:u8 dataLength:u32be name data`.  Integers
 * are little endian using only as many bytes as needed, so zero has no data.
 * The frame length prefix is handled by SocketHandler.
 */
class HtspCodec {
 public:
  /** @brief Encodes the message body (without the length prefix). */
  static string serialize(const HtspMessage& message);

  /**
   * @brief Decodes a message body.
   * @throws ProtocolError on truncated data or unknown field types.
   */
  static HtspMessage deserialize(const string& body);

 protected:
  static void serializeFields(const vector<HtspField>& fields, string* out);
  static void deserializeFields(const char* data, size_t length,
                                vector<HtspField>* out, int depth);
};
}  // namespace tvh

#endif  // __TVH_HTSP_CODEC__
