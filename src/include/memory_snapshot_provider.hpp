#pragma once

#include "duckdb/common/atomic.hpp"
#include "duckdb/common/mutex.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "memory_snapshot.hpp"

#include <cstdint>

namespace duckdb {

class DatabaseInstance;

// Files the provider reads, overridable so the provider can be pointed at fixtures
struct MemorySnapshotProviderConfig {
	string cgroup_usage_path = "/sys/fs/cgroup/memory/memory.usage_in_bytes";
	string cgroup_limit_path = "/sys/fs/cgroup/memory/memory.limit_in_bytes";
	string meminfo_path = "/proc/meminfo";
};

// Reports total and available physical memory, preferring the cgroup (v1) memory controller and falling back to
// /proc/meminfo. The first time the cgroup files can't be used, the cgroup path is disabled for the lifetime of the
// provider. Memory numbers themselves are never cached.
class MemorySnapshotProvider {
public:
	MemorySnapshotProvider();
	explicit MemorySnapshotProvider(MemorySnapshotProviderConfig config);

	// Process-wide provider reading the default paths
	static MemorySnapshotProvider &Get();

	// Throws MemoryUnavailableException if no source yields a valid reading.
	// `db` is only used as the logging target, pass nullptr to skip logging.
	MemorySnapshot GetSnapshot(optional_ptr<DatabaseInstance> db = nullptr);

	// Whether the cgroup files will still be tried
	bool CgroupEnabled() const {
		return try_cgroup.load();
	}

	const MemorySnapshotProviderConfig &GetConfig() const {
		return config;
	}

private:
	// Fills `total` and `free` from the cgroup files. Returns false, and disables the cgroup path, if they can't be used.
	bool TryGetCgroupSnapshot(optional_ptr<DatabaseInstance> db, int64_t &total, int64_t &free);
	MemorySnapshot GetMeminfoSnapshot(optional_ptr<DatabaseInstance> db);

	const MemorySnapshotProviderConfig config;
	// Held for the whole GetSnapshot call
	mutex snapshot_lock;
	// Only ever goes from true to false
	atomic<bool> try_cgroup;
};

} // namespace duckdb
