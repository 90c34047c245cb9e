#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/common/vector.hpp"
#include "memory_snapshot.hpp"

#include <cstdint>

namespace duckdb {

// Byte counts collected from one /proc/meminfo parse, -1 means the field was absent
struct ParsedMeminfoFields {
	int64_t total = -1;
	int64_t available = -1;
	int64_t free = -1;
	int64_t buffers = -1;
	int64_t cached = -1;
	int64_t reclaimable = -1;
	int64_t mapped = -1;

	int64_t GetTotal() const {
		return total;
	}

	// Linux >= 3.14: MemAvailable
	// Older kernels: MemFree + Buffers + Cached + SReclaimable - Mapped
	// Returns -1 if neither can be resolved
	int64_t GetAvailable() const;

	string ToString() const;
};

// Parse a /proc/meminfo line such as "MemAvailable:    2109560 kB" into bytes.
// Throws MemoryUnavailableException (MEMINFO_UNPARSABLE) if the value isn't stated in kB.
int64_t ParseMeminfoBytes(const string &line);

// Collect the recognized fields out of the lines of /proc/meminfo
ParsedMeminfoFields ParseMeminfoFields(const vector<string> &lines);

// Given lines of /proc/meminfo, return a snapshot of (total, available).
// Either value is -1 if it cannot be resolved, the caller decides whether that's fatal.
MemorySnapshot ParseMeminfoSnapshot(const vector<string> &lines);

} // namespace duckdb
