#ifndef __TVH_TUNER_DATA_HELPER__
#define __TVH_TUNER_DATA_HELPER__

#include "EntityCache.hpp"
#include "Headers.hpp"

namespace tvh {
/**
 * @brief Tuner inputs, derived from the services listed in channel messages.
 * A tuner lives as long as at least one channel references it.
 */
class TunerDataHelper {
 public:
  TunerDataHelper();

  void clean();

  /**
   * @brief Replaces the set of tuners carrying `channelId`.
   */
  void setChannelTuners(uint32_t channelId, const vector<TunerInput>& tuners);

  /** @brief Forgets `channelId` and drops tuners left without channels. */
  void removeChannel(uint32_t channelId);

  /** @brief Tuners ordered by name. */
  vector<TunerInput> buildTunerSnapshot();

  CacheStats getStats() { return tuners.getStats(); }

 protected:
  void detachChannel(uint32_t channelId);

  std::mutex helperMutex;
  EntityCache<string, TunerInput> tuners;
};
}  // namespace tvh

#endif  // __TVH_TUNER_DATA_HELPER__
