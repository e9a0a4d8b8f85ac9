#include "TunerDataHelper.hpp"

namespace tvh {
TunerDataHelper::TunerDataHelper() : tuners("tuner") {}

void TunerDataHelper::clean() {
  lock_guard<std::mutex> guard(helperMutex);
  tuners.clean();
}

void TunerDataHelper::setChannelTuners(uint32_t channelId,
                                       const vector<TunerInput>& channelTuners) {
  lock_guard<std::mutex> guard(helperMutex);
  detachChannel(channelId);
  for (const auto& input : channelTuners) {
    TunerInput tuner;
    if (!tuners.get(input.name(), &tuner)) {
      tuner.set_name(input.name());
    }
    if (input.has_type()) {
      tuner.set_type(input.type());
    }
    tuner.add_channel_ids(channelId);
    tuners.add(tuner.name(), tuner);
  }
}

void TunerDataHelper::removeChannel(uint32_t channelId) {
  lock_guard<std::mutex> guard(helperMutex);
  detachChannel(channelId);
}

vector<TunerInput> TunerDataHelper::buildTunerSnapshot() {
  // Keyed by name, so the snapshot is already ordered by name.
  return tuners.snapshot();
}

void TunerDataHelper::detachChannel(uint32_t channelId) {
  for (auto tuner : tuners.snapshot()) {
    auto* ids = tuner.mutable_channel_ids();
    auto it = std::find(ids->begin(), ids->end(), channelId);
    if (it == ids->end()) {
      continue;
    }
    ids->erase(it);
    if (ids->empty()) {
      VLOG(1) << "Tuner '" << tuner.name() << "' carries no more channels";
      tuners.remove(tuner.name());
    } else {
      tuners.add(tuner.name(), tuner);
    }
  }
}
}  // namespace tvh
