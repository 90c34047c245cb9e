#pragma once

#include <cstdint>

namespace duckdb {

// Physical memory as seen through whichever source produced it (host-wide or cgroup-scoped).
struct MemorySnapshot {
	MemorySnapshot(int64_t total_memory_p, int64_t free_memory_p)
	    : total_memory(total_memory_p), free_memory(free_memory_p) {
	}

	const int64_t total_memory;
	const int64_t free_memory;
};

} // namespace duckdb
