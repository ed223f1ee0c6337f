#pragma once

#include "Driver.hpp"
#include <sys/types.h>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqladapter {

using ProcessId = pid_t;

// Returns the identity of the process currently using the cache
using IdentitySource = std::function<ProcessId()>;

struct CacheEntry {
    std::string sql;
    std::unique_ptr<DriverStatement> statement;
    std::optional<std::vector<std::string>> columns;  // filled after the first metadata fetch
};

/**
 * @class StatementCache
 * @brief Bounded SQL → prepared statement cache, partitioned by process identity.
 *
 * Every operation works on the partition of the identity returned by the
 * IdentitySource. A forked child therefore sees an empty partition and never
 * touches statements prepared by its parent on the shared server session.
 *
 * Entries are evicted oldest-inserted first once a partition holds
 * capacity() entries; the evicted statement is closed before removal.
 *
 * Thread Safety: none. One cache belongs to one connection.
 */
class StatementCache {
public:
    struct Partition {
        std::list<CacheEntry> entries;  // insertion order, oldest first
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> index;
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        size_t evictions = 0;
    };

    /**
     * @param max Entries per partition, at least 1.
     * @param identity Source of the current process identity.
     * @throws std::invalid_argument if max is 0.
     */
    explicit StatementCache(size_t max = 1000, IdentitySource identity = currentProcessId);

    /**
     * @brief Closes the statements of the current process only.
     */
    ~StatementCache();

    // Non-copyable
    StatementCache(const StatementCache&) = delete;
    StatementCache& operator=(const StatementCache&) = delete;

    /**
     * @brief Look up a statement in the current partition.
     * @return The entry, or nullptr. Valid until the entry is removed or evicted.
     */
    CacheEntry* get(const std::string& sql);

    /**
     * @brief Insert a statement, evicting the oldest entries to stay within capacity.
     *
     * Replacing an existing key closes the replaced statement and keeps the
     * entry's position.
     */
    CacheEntry& put(const std::string& sql, std::unique_ptr<DriverStatement> statement);

    /**
     * @brief Remove an entry without closing its statement.
     *
     * Callers that drop a statement after an error close it first.
     * @return true if an entry was removed.
     */
    bool remove(const std::string& sql);

    // Close every statement in the current partition and empty it
    void clear();

    bool contains(const std::string& sql) const;

    // Entries in the current partition
    size_t size() const;
    size_t capacity() const { return m_max; }
    size_t partitionCount() const { return m_partitions.size(); }

    // SQL texts of the current partition, oldest first
    std::vector<std::string> keys() const;

    Stats getStats() const { return m_stats; }

    /**
     * @brief Get or create the partition of an identity.
     *
     * A partition that does not exist yet is created empty.
     */
    Partition& partitionFor(ProcessId identity);

    ProcessId currentIdentity() const { return m_identity(); }

    static ProcessId currentProcessId();

private:
    Partition& activePartition() { return partitionFor(m_identity()); }
    const Partition* findPartition(ProcessId identity) const;
    void evictOldest(Partition& partition);

    size_t m_max;
    IdentitySource m_identity;
    std::unordered_map<ProcessId, Partition> m_partitions;
    Stats m_stats;
};

}  // namespace sqladapter
