#define DUCKDB_EXTENSION_MAIN

#include "memory_snapshot_extension.hpp"

#include "duckdb.hpp"
#include "memory_snapshot_query_function.hpp"

namespace duckdb {

namespace {

void LoadInternal(ExtensionLoader &loader) {
	RegisterSysMemorySnapshotFunction(loader);
}

} // namespace

void MemorySnapshotExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

string MemorySnapshotExtension::Name() {
	return "memory_snapshot";
}

string MemorySnapshotExtension::Version() const {
#ifdef EXT_VERSION_MEMORY_SNAPSHOT
	return EXT_VERSION_MEMORY_SNAPSHOT;
#else
	return "0.1.0";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(memory_snapshot, loader) {
	duckdb::LoadInternal(loader);
}
}
