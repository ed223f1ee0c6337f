#include "StatementCache.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <stdexcept>

namespace sqladapter {

StatementCache::StatementCache(size_t max, IdentitySource identity)
    : m_max(max), m_identity(std::move(identity)) {
    if (m_max == 0) {
        throw std::invalid_argument("statement cache capacity must be at least 1");
    }
    if (!m_identity) {
        m_identity = currentProcessId;
    }
}

StatementCache::~StatementCache() {
    ProcessId self = m_identity();
    for (auto& [identity, partition] : m_partitions) {
        for (auto& entry : partition.entries) {
            if (!entry.statement) continue;
            if (identity == self) {
                entry.statement->close();
            } else {
                // Belongs to another process's session; leave the handle alone
                entry.statement->detach();
            }
        }
    }
}

ProcessId StatementCache::currentProcessId() {
    return ::getpid();
}

StatementCache::Partition& StatementCache::partitionFor(ProcessId identity) {
    auto it = m_partitions.find(identity);
    if (it == m_partitions.end()) {
        it = m_partitions.emplace(identity, Partition{}).first;
        if (m_partitions.size() > 1) {
            spdlog::debug("Statement cache partition created for process {}", identity);
        }
    }
    return it->second;
}

const StatementCache::Partition* StatementCache::findPartition(ProcessId identity) const {
    auto it = m_partitions.find(identity);
    return it == m_partitions.end() ? nullptr : &it->second;
}

CacheEntry* StatementCache::get(const std::string& sql) {
    auto& partition = activePartition();

    auto it = partition.index.find(sql);
    if (it == partition.index.end()) {
        m_stats.misses++;
        return nullptr;
    }

    m_stats.hits++;
    return &*it->second;
}

CacheEntry& StatementCache::put(const std::string& sql, std::unique_ptr<DriverStatement> statement) {
    auto& partition = activePartition();

    auto existing = partition.index.find(sql);
    if (existing != partition.index.end()) {
        CacheEntry& entry = *existing->second;
        if (entry.statement) {
            entry.statement->close();
        }
        entry.statement = std::move(statement);
        entry.columns.reset();
        return entry;
    }

    while (partition.entries.size() >= m_max) {
        evictOldest(partition);
    }

    partition.entries.push_back(CacheEntry{sql, std::move(statement), std::nullopt});
    auto pos = std::prev(partition.entries.end());
    partition.index.emplace(sql, pos);

    return *pos;
}

bool StatementCache::remove(const std::string& sql) {
    auto& partition = activePartition();

    auto it = partition.index.find(sql);
    if (it == partition.index.end()) {
        return false;
    }

    partition.entries.erase(it->second);
    partition.index.erase(it);
    return true;
}

void StatementCache::clear() {
    auto& partition = activePartition();

    for (auto& entry : partition.entries) {
        if (entry.statement) entry.statement->close();
    }

    size_t count = partition.entries.size();
    partition.index.clear();
    partition.entries.clear();

    if (count > 0) {
        spdlog::debug("Statement cache cleared ({} statements closed)", count);
    }
}

bool StatementCache::contains(const std::string& sql) const {
    const Partition* partition = findPartition(m_identity());
    return partition && partition->index.count(sql) > 0;
}

size_t StatementCache::size() const {
    const Partition* partition = findPartition(m_identity());
    return partition ? partition->entries.size() : 0;
}

std::vector<std::string> StatementCache::keys() const {
    std::vector<std::string> result;
    const Partition* partition = findPartition(m_identity());
    if (!partition) return result;

    result.reserve(partition->entries.size());
    for (const auto& entry : partition->entries) {
        result.push_back(entry.sql);
    }
    return result;
}

void StatementCache::evictOldest(Partition& partition) {
    auto oldest = partition.entries.begin();

    if (oldest->statement) oldest->statement->close();
    partition.index.erase(oldest->sql);
    partition.entries.erase(oldest);

    m_stats.evictions++;
    spdlog::debug("Evicted prepared statement (limit {})", m_max);
}

}  // namespace sqladapter
