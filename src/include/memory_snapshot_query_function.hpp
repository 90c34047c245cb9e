#pragma once

#include "duckdb.hpp"

namespace duckdb {

class MemorySnapshotProvider;

// Register sys_memory_snapshot table function, reading from the process-wide provider
void RegisterSysMemorySnapshotFunction(ExtensionLoader &loader);

// Same, reading from `provider`, which must outlive the database
void RegisterSysMemorySnapshotFunction(ExtensionLoader &loader, MemorySnapshotProvider &provider);

} // namespace duckdb
