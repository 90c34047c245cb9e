#include "memory_snapshot_provider.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"
#include "memory_snapshot_exception.hpp"
#include "meminfo_parser.hpp"

#ifdef __linux__
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#endif

namespace duckdb {

namespace {

void LogDebug(optional_ptr<DatabaseInstance> db, const string &message) {
	if (!db) {
		return;
	}
	DUCKDB_LOG_DEBUG(*db, message);
}

#ifdef __linux__
// cgroup memory files hold a single decimal byte count on their first line
bool ReadCgroupValue(std::ifstream &file, int64_t &value) {
	string line;
	if (!std::getline(file, line)) {
		return false;
	}
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	const char *end = line.data() + line.size();
	auto result = std::from_chars(line.data(), end, value);
	return result.ec == std::errc() && result.ptr == end && !line.empty() && value >= 0;
}
#endif

} // namespace

MemorySnapshotProvider::MemorySnapshotProvider() : MemorySnapshotProvider(MemorySnapshotProviderConfig()) {
}

MemorySnapshotProvider::MemorySnapshotProvider(MemorySnapshotProviderConfig config_p)
    : config(std::move(config_p)), try_cgroup(true) {
}

MemorySnapshotProvider &MemorySnapshotProvider::Get() {
	static MemorySnapshotProvider provider;
	return provider;
}

MemorySnapshot MemorySnapshotProvider::GetSnapshot(optional_ptr<DatabaseInstance> db) {
#ifdef __linux__
	lock_guard<mutex> guard(snapshot_lock);
	if (try_cgroup.load()) {
		int64_t total = 0;
		int64_t free = 0;
		if (TryGetCgroupSnapshot(db, total, free)) {
			return MemorySnapshot(total, free);
		}
	}
	return GetMeminfoSnapshot(db);
#else
	throw NotImplementedException("Memory snapshots are not supported on this platform");
#endif
}

bool MemorySnapshotProvider::TryGetCgroupSnapshot(optional_ptr<DatabaseInstance> db, int64_t &total, int64_t &free) {
#ifdef __linux__
	std::ifstream usage_file(config.cgroup_usage_path);
	std::ifstream limit_file(config.cgroup_limit_path);
	if (!usage_file.is_open() || !limit_file.is_open()) {
		try_cgroup.store(false);
		LogDebug(db, StringUtil::Format("CGroup files %s and %s are not readable, using %s from now on (%s)",
		                                config.cgroup_usage_path, config.cgroup_limit_path, config.meminfo_path,
		                                MemorySnapshotErrorKindToString(MemorySnapshotErrorKind::CGROUP_UNAVAILABLE)));
		return false;
	}

	int64_t usage = 0;
	int64_t limit = 0;
	if (!ReadCgroupValue(usage_file, usage) || !ReadCgroupValue(limit_file, limit)) {
		try_cgroup.store(false);
		LogDebug(db, StringUtil::Format("Unable to read CGroup files %s and %s (%s)", config.cgroup_usage_path,
		                                config.cgroup_limit_path,
		                                MemorySnapshotErrorKindToString(MemorySnapshotErrorKind::CGROUP_UNAVAILABLE)));
		return false;
	}

	total = limit;
	free = usage >= limit ? 0 : limit - usage;
	return true;
#else
	return false;
#endif
}

MemorySnapshot MemorySnapshotProvider::GetMeminfoSnapshot(optional_ptr<DatabaseInstance> db) {
#ifdef __linux__
	std::ifstream meminfo(config.meminfo_path);
	if (!meminfo.is_open()) {
		string cause = std::strerror(errno);
		LogDebug(db, StringUtil::Format("Unable to read system memory from %s due to '%s'", config.meminfo_path, cause));
		throw MemoryUnavailableException(MemorySnapshotErrorKind::MEMINFO_UNREADABLE,
		                                 StringUtil::Format("Unable to read system memory from %s", config.meminfo_path),
		                                 cause);
	}

	vector<string> lines;
	string line;
	while (std::getline(meminfo, line)) {
		lines.emplace_back(std::move(line));
	}
	if (meminfo.bad()) {
		throw MemoryUnavailableException(MemorySnapshotErrorKind::MEMINFO_UNREADABLE,
		                                 StringUtil::Format("Unable to read system memory from %s", config.meminfo_path),
		                                 "read error");
	}

	auto fields = ParseMeminfoFields(lines);
	LogDebug(db, StringUtil::Format("Parsed %s into %s", config.meminfo_path, fields.ToString()));

	MemorySnapshot snapshot(fields.GetTotal(), fields.GetAvailable());
	if (snapshot.total_memory < 0 || snapshot.free_memory < 0) {
		LogDebug(db, StringUtil::Format("Unable to read system memory from %s due to negative values",
		                                config.meminfo_path));
		throw MemoryUnavailableException(MemorySnapshotErrorKind::MEMINFO_INCOMPLETE,
		                                 StringUtil::Format("Unable to read system memory from %s", config.meminfo_path));
	}
	return snapshot;
#else
	throw NotImplementedException("Memory snapshots are not supported on this platform");
#endif
}

} // namespace duckdb
