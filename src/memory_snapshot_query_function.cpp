#include "memory_snapshot_query_function.hpp"

#include "duckdb/common/assert.hpp"
#include "duckdb/common/types/value.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/database.hpp"
#include "memory_snapshot_provider.hpp"
#include "memory_unit_util.hpp"

namespace duckdb {

namespace {

// Provider the registered function reads from
struct SysMemorySnapshotFunctionInfo : public TableFunctionInfo {
	explicit SysMemorySnapshotFunctionInfo(MemorySnapshotProvider &provider_p) : provider(provider_p) {
	}
	MemorySnapshotProvider &provider;
};

struct SysMemorySnapshotBindData : public FunctionData {
	explicit SysMemorySnapshotBindData(MemorySnapshotProvider &provider_p) : provider(provider_p) {
	}

	MemorySnapshotProvider &provider;
	MemoryUnit unit = MemoryUnit::BYTES;

	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<SysMemorySnapshotBindData>();
		return &provider == &other.provider && unit == other.unit;
	}

	unique_ptr<FunctionData> Copy() const override {
		auto result = make_uniq<SysMemorySnapshotBindData>(provider);
		result->unit = unit;
		return std::move(result);
	}
};

struct SysMemorySnapshotData : public GlobalTableFunctionState {
	SysMemorySnapshotData() : finished(false) {
	}
	bool finished;
};

unique_ptr<FunctionData> SysMemorySnapshotBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());
	D_ASSERT(input.info);
	auto &info = input.info->Cast<SysMemorySnapshotFunctionInfo>();
	auto result = make_uniq<SysMemorySnapshotBindData>(info.provider);

	auto unit_it = input.named_parameters.find("unit");
	if (unit_it != input.named_parameters.end()) {
		result->unit = ParseUnit(unit_it->second.ToString());
	}

	names.emplace_back("total_memory");
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});

	names.emplace_back("free_memory");
	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});

	return std::move(result);
}

unique_ptr<GlobalTableFunctionState> SysMemorySnapshotInit(ClientContext &context, TableFunctionInitInput &input) {
	return make_uniq<SysMemorySnapshotData>();
}

void SysMemorySnapshotFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<SysMemorySnapshotData>();
	auto &bind_data = data_p.bind_data->Cast<SysMemorySnapshotBindData>();

	if (data.finished) {
		return;
	}

	// Provider guarantees both values are non-negative
	auto &db = DatabaseInstance::GetDatabase(context);
	MemorySnapshot snapshot = bind_data.provider.GetSnapshot(&db);

	idx_t col_idx = 0;
	output.SetValue(col_idx++, 0,
	                Value::UBIGINT(ConvertBytes(static_cast<uint64_t>(snapshot.total_memory), bind_data.unit)));
	output.SetValue(col_idx++, 0,
	                Value::UBIGINT(ConvertBytes(static_cast<uint64_t>(snapshot.free_memory), bind_data.unit)));

	output.SetCardinality(1);
	data.finished = true;
}

} // namespace

void RegisterSysMemorySnapshotFunction(ExtensionLoader &loader) {
	RegisterSysMemorySnapshotFunction(loader, MemorySnapshotProvider::Get());
}

void RegisterSysMemorySnapshotFunction(ExtensionLoader &loader, MemorySnapshotProvider &provider) {
	TableFunction sys_memory_snapshot_func("sys_memory_snapshot", {}, SysMemorySnapshotFunc, SysMemorySnapshotBind,
	                                       SysMemorySnapshotInit);
	sys_memory_snapshot_func.named_parameters["unit"] = LogicalType::VARCHAR;
	sys_memory_snapshot_func.function_info = make_shared_ptr<SysMemorySnapshotFunctionInfo>(provider);
	loader.RegisterFunction(sys_memory_snapshot_func);
}

} // namespace duckdb
