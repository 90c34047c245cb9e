#include "memory_unit_util.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

namespace {

struct MemoryUnitEntry {
	const char *name;
	MemoryUnit unit;
	uint64_t size;
};

const MemoryUnitEntry MEMORY_UNITS[] = {
    {"bytes", MemoryUnit::BYTES, 1},
    {"kb", MemoryUnit::KB, 1000ULL},
    {"kib", MemoryUnit::KiB, 1024ULL},
    {"mb", MemoryUnit::MB, 1000ULL * 1000},
    {"mib", MemoryUnit::MiB, 1024ULL * 1024},
    {"gb", MemoryUnit::GB, 1000ULL * 1000 * 1000},
    {"gib", MemoryUnit::GiB, 1024ULL * 1024 * 1024},
    {"tb", MemoryUnit::TB, 1000ULL * 1000 * 1000 * 1000},
    {"tib", MemoryUnit::TiB, 1024ULL * 1024 * 1024 * 1024},
};

} // namespace

uint64_t GetUnitSize(MemoryUnit unit) {
	for (const auto &entry : MEMORY_UNITS) {
		if (entry.unit == unit) {
			return entry.size;
		}
	}
	throw InternalException("Unknown memory unit");
}

uint64_t ConvertBytes(uint64_t bytes, MemoryUnit unit) {
	return bytes / GetUnitSize(unit);
}

MemoryUnit ParseUnit(const string &unit_str) {
	string lower_unit = StringUtil::Lower(unit_str);
	// Short alias for bytes
	if (lower_unit == "b") {
		return MemoryUnit::BYTES;
	}
	for (const auto &entry : MEMORY_UNITS) {
		if (lower_unit == entry.name) {
			return entry.unit;
		}
	}
	throw InvalidInputException("Invalid unit '%s'. Supported units: bytes, KB, KiB, MB, MiB, GB, GiB, TB, TiB",
	                            unit_str);
}

} // namespace duckdb
