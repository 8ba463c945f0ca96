#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>
#include <vector>

#include "duckdb.hpp"

#include "chhttp/exception.hpp"
#include "chhttp/table/duckdb_table_decoder.hpp"
#include "chhttp/util/log.hpp"

namespace chhttp {

// Removes the file when the decode is done, whatever the outcome.
class TemporaryFile {
public:
	explicit TemporaryFile(const std::string &bytes) {
		const char *tmpdir = std::getenv("TMPDIR");
		std::string pattern = std::string(tmpdir && *tmpdir ? tmpdir : "/tmp") + "/chhttp-XXXXXX.parquet";
		std::vector<char> name(pattern.begin(), pattern.end());
		name.push_back('\0');

		int fd = ::mkstemps(name.data(), 8);
		if (fd < 0) {
			throw DecodeException("Failed to create temporary file: " + std::string(std::strerror(errno)));
		}
		path = name.data();

		size_t written = 0;
		while (written < bytes.size()) {
			auto n = ::write(fd, bytes.data() + written, bytes.size() - written);
			if (n < 0) {
				if (errno == EINTR) {
					continue;
				}
				int err = errno;
				::close(fd);
				std::remove(path.c_str());
				throw DecodeException("Failed to write temporary file: " + std::string(std::strerror(err)));
			}
			written += static_cast<size_t>(n);
		}
		::close(fd);
	}

	~TemporaryFile() {
		std::remove(path.c_str());
	}

	TemporaryFile(const TemporaryFile &) = delete;
	TemporaryFile &operator=(const TemporaryFile &) = delete;

	const std::string &Path() const {
		return path;
	}

private:
	std::string path;
};

DuckDBTableDecoder::DuckDBTableDecoder() : db(std::make_shared<duckdb::DuckDB>(nullptr)) {
}

DuckDBTableDecoder::DuckDBTableDecoder(std::shared_ptr<duckdb::DuckDB> db) : db(std::move(db)) {
}

bool DuckDBTableDecoder::IsAvailable() {
	std::call_once(probe, [this]() {
		duckdb::Connection conn(*db);
		auto load_result = conn.Query("LOAD parquet");
		if (load_result->HasError()) {
			log::warn("DuckDB parquet extension unavailable: " + load_result->GetError());
			available = false;
		} else {
			available = true;
		}
	});
	return available;
}

std::shared_ptr<DataTable> DuckDBTableDecoder::DecodeParquet(const std::string &bytes) {
	if (!IsAvailable()) {
		throw MissingDependencyException("DuckDB parquet extension is not available");
	}

	TemporaryFile file(bytes);
	std::string escaped_path;
	for (char c : file.Path()) {
		escaped_path += c;
		if (c == '\'') {
			escaped_path += '\'';
		}
	}

	duckdb::Connection conn(*db);
	auto result = conn.Query("SELECT * FROM read_parquet('" + escaped_path + "')");
	if (result->HasError()) {
		throw DecodeException("Failed to decode Parquet body: " + result->GetError());
	}

	auto table = std::make_shared<DataTable>();
	auto rows = result->RowCount();
	try {
		for (duckdb::idx_t col = 0; col < result->ColumnCount(); col++) {
			DataColumn column;
			column.name = result->ColumnName(col);
			column.type = result->types[col];
			column.values.reserve(rows);
			for (duckdb::idx_t row = 0; row < rows; row++) {
				column.values.push_back(result->GetValue(col, row));
			}
			table->AddColumn(std::move(column));
		}
	} catch (const duckdb::Exception &e) {
		throw DecodeException("Failed to decode Parquet body: " + std::string(e.what()));
	}
	log::debug("decoded Parquet body: " + std::to_string(table->ColumnCount()) + " columns, " +
	           std::to_string(table->RowCount()) + " rows");
	return table;
}

} // namespace chhttp
