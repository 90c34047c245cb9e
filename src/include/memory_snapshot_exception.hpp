#pragma once

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string.hpp"

namespace duckdb {

enum class MemorySnapshotErrorKind {
	CGROUP_UNAVAILABLE, // Internal only, the provider absorbs it and falls back to /proc/meminfo
	MEMINFO_UNREADABLE,
	MEMINFO_UNPARSABLE,
	MEMINFO_INCOMPLETE
};

// Util function to get a printable name of the error kind
string MemorySnapshotErrorKindToString(MemorySnapshotErrorKind kind);

// Thrown when neither cgroup nor /proc/meminfo yields a valid reading
class MemoryUnavailableException : public Exception {
public:
	MemoryUnavailableException(MemorySnapshotErrorKind kind_p, const string &msg, const string &cause_p = "");

	MemorySnapshotErrorKind GetErrorKind() const {
		return kind;
	}
	// Underlying OS error text, empty if there is none
	const string &GetCause() const {
		return cause;
	}

private:
	MemorySnapshotErrorKind kind;
	string cause;
};

} // namespace duckdb
