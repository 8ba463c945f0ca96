#pragma once

#include <string>
#include <vector>

#include "duckdb.hpp"

namespace chhttp {

struct DataColumn {
	std::string name;
	duckdb::LogicalType type;
	std::vector<duckdb::Value> values;
};

// A fully materialized, column-oriented query result.
class DataTable {
public:
	DataTable() = default;
	explicit DataTable(std::vector<DataColumn> columns) : columns(std::move(columns)) {
	}

	size_t ColumnCount() const {
		return columns.size();
	}

	size_t RowCount() const;

	const std::vector<DataColumn> &Columns() const {
		return columns;
	}

	const DataColumn &GetColumn(size_t index) const;
	const DataColumn &GetColumn(const std::string &name) const;

	// Throws DecodeException when there is no column of that name.
	size_t ColumnIndex(const std::string &name) const;

	const duckdb::Value &GetValue(size_t column, size_t row) const;

	void AddColumn(DataColumn column);

private:
	std::vector<DataColumn> columns;
};

} // namespace chhttp
