#include "chhttp/table/data_table.hpp"
#include "chhttp/exception.hpp"

namespace chhttp {

size_t DataTable::RowCount() const {
	if (columns.empty()) {
		return 0;
	}
	return columns.front().values.size();
}

const DataColumn &DataTable::GetColumn(size_t index) const {
	if (index >= columns.size()) {
		throw DecodeException("column index " + std::to_string(index) + " out of range");
	}
	return columns[index];
}

const DataColumn &DataTable::GetColumn(const std::string &name) const {
	return columns[ColumnIndex(name)];
}

size_t DataTable::ColumnIndex(const std::string &name) const {
	for (size_t i = 0; i < columns.size(); i++) {
		if (columns[i].name == name) {
			return i;
		}
	}
	throw DecodeException("column not found: " + name);
}

const duckdb::Value &DataTable::GetValue(size_t column, size_t row) const {
	const auto &col = GetColumn(column);
	if (row >= col.values.size()) {
		throw DecodeException("row index " + std::to_string(row) + " out of range");
	}
	return col.values[row];
}

void DataTable::AddColumn(DataColumn column) {
	if (!columns.empty() && column.values.size() != RowCount()) {
		throw DecodeException("column " + column.name + " has " + std::to_string(column.values.size()) +
		                      " rows, expected " + std::to_string(RowCount()));
	}
	columns.push_back(std::move(column));
}

} // namespace chhttp
