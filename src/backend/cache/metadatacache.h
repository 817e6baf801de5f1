#ifndef METADATACACHE_H
#define METADATACACHE_H

#include <QCache>
#include <QMutex>
#include <QMutexLocker>
#include <optional>

namespace Songbook {

// Bounded least-recently-used cache shared between scan workers.
//
// Every entry costs 1, so QCache's max cost is the entry capacity and inserting
// past it drops the least recently touched entry. get() and put() both refresh
// recency. The mutex is held for the map operation only; callers must not hold
// it across extraction I/O, which is why values are returned by copy.
template <typename Key, typename Value>
class MetadataCache
{
public:
    explicit MetadataCache(int capacity)
        : m_cache(capacity)
    {
    }

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    std::optional<Value> get(const Key& key) const
    {
        QMutexLocker locker(&m_mutex);
        const Value* value = m_cache.object(key);
        if (!value) {
            return std::nullopt;
        }
        return *value;
    }

    void put(const Key& key, const Value& value)
    {
        QMutexLocker locker(&m_mutex);
        m_cache.insert(key, new Value(value));
    }

    bool remove(const Key& key)
    {
        QMutexLocker locker(&m_mutex);
        return m_cache.remove(key);
    }

    bool contains(const Key& key) const
    {
        QMutexLocker locker(&m_mutex);
        return m_cache.contains(key);
    }

    void clear()
    {
        QMutexLocker locker(&m_mutex);
        m_cache.clear();
    }

    int size() const
    {
        QMutexLocker locker(&m_mutex);
        return static_cast<int>(m_cache.size());
    }

    int capacity() const
    {
        QMutexLocker locker(&m_mutex);
        return static_cast<int>(m_cache.maxCost());
    }

private:
    mutable QMutex m_mutex;
    QCache<Key, Value> m_cache;
};

} // namespace Songbook

#endif // METADATACACHE_H
