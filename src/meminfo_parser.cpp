#include "meminfo_parser.hpp"

#include "duckdb/common/limits.hpp"
#include "duckdb/common/operator/add.hpp"
#include "duckdb/common/operator/subtract.hpp"
#include "duckdb/common/string_util.hpp"
#include "memory_snapshot_exception.hpp"

#include <charconv>
#include <string_view>

namespace duckdb {

namespace {

// /proc/meminfo values have been stated in kB since Linux 4.0
constexpr std::string_view KB_SUFFIX = " kB";
constexpr const char *DIGITS = "0123456789";
constexpr int64_t BYTES_PER_KB = 1024;

[[noreturn]] void ThrowUnparsable() {
	throw MemoryUnavailableException(MemorySnapshotErrorKind::MEMINFO_UNPARSABLE,
	                                 "Unable to parse /proc/meminfo output to get system memory");
}

struct MeminfoLabel {
	const char *prefix;
	int64_t ParsedMeminfoFields::*field;
};

// Matched in order, the first prefix wins
const MeminfoLabel MEMINFO_LABELS[] = {
    {"MemAvailable", &ParsedMeminfoFields::available}, {"MemFree", &ParsedMeminfoFields::free},
    {"Buffers", &ParsedMeminfoFields::buffers},        {"Cached", &ParsedMeminfoFields::cached},
    {"SReclaimable", &ParsedMeminfoFields::reclaimable}, {"Mapped", &ParsedMeminfoFields::mapped},
    {"MemTotal", &ParsedMeminfoFields::total},
};

} // namespace

int64_t ParsedMeminfoFields::GetAvailable() const {
	if (available != -1) {
		return available;
	}
	if (free == -1 || buffers == -1 || cached == -1 || reclaimable == -1 || mapped == -1) {
		return -1;
	}
	// Unresolved if the sum doesn't fit in int64
	int64_t result = free;
	if (!TryAddOperator::Operation(result, buffers, result) || !TryAddOperator::Operation(result, cached, result) ||
	    !TryAddOperator::Operation(result, reclaimable, result) ||
	    !TrySubtractOperator::Operation(result, mapped, result)) {
		return -1;
	}
	return result;
}

string ParsedMeminfoFields::ToString() const {
	return StringUtil::Format(
	    "Meminfo{total=%d, available=%d, free=%d, buffers=%d, cached=%d, reclaimable=%d, mapped=%d}",
	    total, available, free, buffers, cached, reclaimable, mapped);
}

int64_t ParseMeminfoBytes(const string &line) {
	// Expected shape: non-digits, then digits, then " kB" at the end of the line
	std::string_view line_sv {line};
	size_t digits_start = line_sv.find_first_of(DIGITS);
	if (digits_start == std::string_view::npos || digits_start == 0) {
		ThrowUnparsable();
	}
	size_t digits_end = line_sv.find_first_not_of(DIGITS, digits_start);
	if (digits_end == std::string_view::npos || line_sv.substr(digits_end) != KB_SUFFIX) {
		ThrowUnparsable();
	}

	int64_t kb = 0;
	auto result = std::from_chars(line_sv.data() + digits_start, line_sv.data() + digits_end, kb);
	if (result.ec != std::errc() || kb > NumericLimits<int64_t>::Maximum() / BYTES_PER_KB) {
		ThrowUnparsable();
	}
	return kb * BYTES_PER_KB;
}

ParsedMeminfoFields ParseMeminfoFields(const vector<string> &lines) {
	ParsedMeminfoFields fields;
	for (const auto &line : lines) {
		for (const auto &label : MEMINFO_LABELS) {
			if (StringUtil::StartsWith(line, label.prefix)) {
				fields.*label.field = ParseMeminfoBytes(line);
				break;
			}
		}
	}
	return fields;
}

MemorySnapshot ParseMeminfoSnapshot(const vector<string> &lines) {
	auto fields = ParseMeminfoFields(lines);
	return MemorySnapshot(fields.GetTotal(), fields.GetAvailable());
}

} // namespace duckdb
