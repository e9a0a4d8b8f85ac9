#ifndef __TVH_AUTOREC_DATA_HELPER__
#define __TVH_AUTOREC_DATA_HELPER__

#include "ChannelDataHelper.hpp"
#include "EntityCache.hpp"
#include "Headers.hpp"
#include "HtspMessage.hpp"

namespace tvh {
/**
 * @brief Mirrors the recurring recording rules (autorec entries).
 */
class AutorecDataHelper {
 public:
  explicit AutorecDataHelper(shared_ptr<ChannelDataHelper> _channelHelper);

  void clean();

  void autorecEntryAdd(const HtspMessage& message);
  void autorecEntryUpdate(const HtspMessage& message);
  void autorecEntryDelete(const HtspMessage& message);

  /** @brief Rules ordered by id. */
  vector<SeriesTimerInfo> buildSeriesTimerSnapshot();

  CacheStats getStats() { return rules.getStats(); }

  static AutorecEntry parseAutorecEntry(const HtspMessage& message);

 protected:
  shared_ptr<ChannelDataHelper> channelHelper;
  EntityCache<string, AutorecEntry> rules;
};
}  // namespace tvh

#endif  // __TVH_AUTOREC_DATA_HELPER__
