#include "memory_snapshot_exception.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

namespace {

ExceptionType GetExceptionType(MemorySnapshotErrorKind kind) {
	if (kind == MemorySnapshotErrorKind::MEMINFO_UNPARSABLE) {
		return ExceptionType::PARSER;
	}
	return ExceptionType::IO;
}

string ConstructMessage(const string &msg, const string &cause) {
	if (cause.empty()) {
		return msg;
	}
	return StringUtil::Format("%s: %s", msg, cause);
}

} // namespace

string MemorySnapshotErrorKindToString(MemorySnapshotErrorKind kind) {
	switch (kind) {
	case MemorySnapshotErrorKind::CGROUP_UNAVAILABLE:
		return "cgroup unavailable";
	case MemorySnapshotErrorKind::MEMINFO_UNREADABLE:
		return "meminfo unreadable";
	case MemorySnapshotErrorKind::MEMINFO_UNPARSABLE:
		return "meminfo unparsable";
	case MemorySnapshotErrorKind::MEMINFO_INCOMPLETE:
		return "meminfo incomplete";
	default:
		throw InternalException("Unknown memory snapshot error kind");
	}
}

MemoryUnavailableException::MemoryUnavailableException(MemorySnapshotErrorKind kind_p, const string &msg,
                                                       const string &cause_p)
    : Exception(GetExceptionType(kind_p), ConstructMessage(msg, cause_p)), kind(kind_p), cause(cause_p) {
}

} // namespace duckdb
