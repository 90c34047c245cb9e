#pragma once

#include <cstdint>

#include "duckdb/common/string.hpp"

namespace duckdb {

enum class MemoryUnit {
	BYTES, // Default
	KB,    // 1000 bytes
	KiB,   // 1024 bytes
	MB,    // 1000^2 bytes
	MiB,   // 1024^2 bytes
	GB,    // 1000^3 bytes
	GiB,   // 1024^3 bytes
	TB,    // 1000^4 bytes
	TiB    // 1024^4 bytes
};

// Number of bytes in one `unit`
uint64_t GetUnitSize(MemoryUnit unit);

// Convert a byte count to the given unit, rounding down
uint64_t ConvertBytes(uint64_t bytes, MemoryUnit unit);

// Case-insensitive, throws InvalidInputException for unknown units
MemoryUnit ParseUnit(const string &unit_str);

} // namespace duckdb
