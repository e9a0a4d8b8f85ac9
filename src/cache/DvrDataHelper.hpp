#ifndef __TVH_DVR_DATA_HELPER__
#define __TVH_DVR_DATA_HELPER__

#include "ChannelDataHelper.hpp"
#include "EntityCache.hpp"
#include "Headers.hpp"
#include "HtspMessage.hpp"

namespace tvh {
/**
 * @brief Mirrors the DVR entries.  Scheduled entries are reported as timers,
 * everything else as recordings.
 */
class DvrDataHelper {
 public:
  explicit DvrDataHelper(shared_ptr<ChannelDataHelper> _channelHelper);

  void clean();

  /**
   * @brief Push handlers for dvrEntryAdd, dvrEntryUpdate and dvrEntryDelete.
   * @throws ProtocolError when the message has no id.
   */
  void dvrEntryAdd(const HtspMessage& message);
  void dvrEntryUpdate(const HtspMessage& message);
  void dvrEntryDelete(const HtspMessage& message);

  /** @brief Entries that are not scheduled, ordered by start and id. */
  vector<RecordingInfo> buildRecordingSnapshot();
  /** @brief Scheduled entries, ordered by start and id. */
  vector<RecordingInfo> buildTimerSnapshot();

  CacheStats getStats() { return entries.getStats(); }

  static DvrEntry parseDvrEntry(const HtspMessage& message);
  static RecordingStatus recordingStatus(const DvrEntry& entry);

 protected:
  vector<RecordingInfo> buildSnapshot(bool scheduled);

  shared_ptr<ChannelDataHelper> channelHelper;
  EntityCache<uint32_t, DvrEntry> entries;
};
}  // namespace tvh

#endif  // __TVH_DVR_DATA_HELPER__
