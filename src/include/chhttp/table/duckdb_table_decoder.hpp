#pragma once

#include <memory>
#include <mutex>

#include "duckdb.hpp"

#include "chhttp/table/table_decoder.hpp"

namespace chhttp {

/**
 * Decodes Parquet bodies with DuckDB's parquet reader.
 *
 * The parquet extension is probed once, on the first IsAvailable() call. Every decode opens its
 * own connection, so one decoder can be shared by concurrent queries.
 */
class DuckDBTableDecoder : public ITableDecoder {
public:
	DuckDBTableDecoder();
	explicit DuckDBTableDecoder(std::shared_ptr<duckdb::DuckDB> db);

	bool IsAvailable() override;
	std::shared_ptr<DataTable> DecodeParquet(const std::string &bytes) override;

	duckdb::DuckDB &GetDatabase() {
		return *db;
	}

private:
	std::shared_ptr<duckdb::DuckDB> db;
	std::once_flag probe;
	bool available = false;
};

} // namespace chhttp
