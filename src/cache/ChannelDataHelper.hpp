#ifndef __TVH_CHANNEL_DATA_HELPER__
#define __TVH_CHANNEL_DATA_HELPER__

#include "EntityCache.hpp"
#include "Headers.hpp"
#include "HtspMessage.hpp"
#include "TunerDataHelper.hpp"

namespace tvh {
/**
 * @brief Mirrors the channel list and keeps the tuner helper in step with
 * the services each channel lists.
 */
class ChannelDataHelper {
 public:
  explicit ChannelDataHelper(shared_ptr<TunerDataHelper> _tunerHelper);

  /** @brief Clears the channels and the tuners derived from them. */
  void clean();

  /**
   * @brief Push handlers for channelAdd, channelUpdate and channelDelete.
   * @throws ProtocolError when the message has no channelId.
   */
  void channelAdd(const HtspMessage& message);
  void channelUpdate(const HtspMessage& message);
  void channelDelete(const HtspMessage& message);

  /** @brief Channels ordered by number, minor number and id. */
  vector<Channel> buildChannelSnapshot();

  /** @brief Name of the channel, or an empty string if it is not known. */
  string getChannelName(uint32_t channelId);

  inline shared_ptr<TunerDataHelper> getTunerHelper() { return tunerHelper; }
  CacheStats getStats() { return channels.getStats(); }

  /**
   * @brief Converts a channel message.  Only the fields present in the
   * message are set.
   */
  static Channel parseChannel(const HtspMessage& message);

 protected:
  static vector<TunerInput> parseTuners(const HtspMessage& message);

  shared_ptr<TunerDataHelper> tunerHelper;
  EntityCache<uint32_t, Channel> channels;
};
}  // namespace tvh

#endif  // __TVH_CHANNEL_DATA_HELPER__
