#ifndef __TVH_ENTITY_CACHE__
#define __TVH_ENTITY_CACHE__

#include "Headers.hpp"

namespace tvh {
/**
 * @brief Counters kept by every cache.  `unknownUpdates` counts updates that
 * had to be turned into adds.
 */
struct CacheStats {
  CacheStats() : adds(0), updates(0), deletes(0), unknownUpdates(0) {}

  int64_t adds;
  int64_t updates;
  int64_t deletes;
  int64_t unknownUpdates;
};

/**
 * @brief Keyed store of protobuf entities mirrored from the server.
 *
 * Writers are serialized by the receive loop; readers may snapshot at any
 * time.  A single entity is always replaced under the cache lock, so readers
 * never see a half merged entity.
 */
template <typename K, typename T>
class EntityCache {
 public:
  explicit EntityCache(const string& _name) : name(_name) {}

  /** @brief Drops every entity and resets the counters. */
  void clean() {
    lock_guard<std::mutex> guard(cacheMutex);
    entities.clear();
    stats = CacheStats();
  }

  /** @brief Stores `entity`, replacing any entity with the same key. */
  void add(const K& key, const T& entity) {
    lock_guard<std::mutex> guard(cacheMutex);
    entities[key] = entity;
    stats.adds++;
  }

  /**
   * @brief Merges `delta` over the cached entity.  Fields set in the delta
   * win; repeated fields that are non-empty in the delta or named in
   * `replacedLists` are replaced instead of appended to.  An unknown key is
   * stored as a new entity.
   */
  void update(const K& key, const T& delta,
              const vector<string>& replacedLists = vector<string>()) {
    lock_guard<std::mutex> guard(cacheMutex);
    auto it = entities.find(key);
    if (it == entities.end()) {
      stats.unknownUpdates++;
      LOG(WARNING) << "Update for unknown " << name << " " << key
                   << ", adding it";
      entities[key] = delta;
      return;
    }
    T merged = it->second;
    mergeDelta(delta, replacedLists, &merged);
    it->second = merged;
    stats.updates++;
  }

  /** @brief Removes the entity.  Returns false if the key was unknown. */
  bool remove(const K& key) {
    lock_guard<std::mutex> guard(cacheMutex);
    if (entities.erase(key) == 0) {
      VLOG(1) << "Delete for unknown " << name << " " << key;
      return false;
    }
    stats.deletes++;
    return true;
  }

  bool get(const K& key, T* entity) {
    lock_guard<std::mutex> guard(cacheMutex);
    auto it = entities.find(key);
    if (it == entities.end()) {
      return false;
    }
    *entity = it->second;
    return true;
  }

  /** @brief Copy of every entity, in key order. */
  vector<T> snapshot() {
    lock_guard<std::mutex> guard(cacheMutex);
    vector<T> retval;
    retval.reserve(entities.size());
    for (const auto& it : entities) {
      retval.push_back(it.second);
    }
    return retval;
  }

  size_t size() {
    lock_guard<std::mutex> guard(cacheMutex);
    return entities.size();
  }

  CacheStats getStats() {
    lock_guard<std::mutex> guard(cacheMutex);
    return stats;
  }

  inline const string& getName() const { return name; }

 protected:
  static void mergeDelta(const T& delta, const vector<string>& replacedLists,
                         T* target) {
    const google::protobuf::Descriptor* descriptor = delta.GetDescriptor();
    const google::protobuf::Reflection* reflection = delta.GetReflection();
    for (int i = 0; i < descriptor->field_count(); i++) {
      const google::protobuf::FieldDescriptor* field = descriptor->field(i);
      if (!field->is_repeated()) {
        continue;
      }
      if (reflection->FieldSize(delta, field) > 0 ||
          std::find(replacedLists.begin(), replacedLists.end(),
                    field->name()) != replacedLists.end()) {
        reflection->ClearField(target, field);
      }
    }
    target->MergeFrom(delta);
  }

  string name;
  std::mutex cacheMutex;
  map<K, T> entities;
  CacheStats stats;
};
}  // namespace tvh

#endif  // __TVH_ENTITY_CACHE__
