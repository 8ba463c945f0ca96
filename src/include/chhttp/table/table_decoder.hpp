#pragma once

#include <memory>
#include <string>

#include "chhttp/table/data_table.hpp"

namespace chhttp {

class ITableDecoder {
public:
	virtual ~ITableDecoder() = default;

	// Whether Parquet decoding can run in this process.
	virtual bool IsAvailable() = 0;

	// Throws DecodeException when the bytes are not a readable Parquet file.
	virtual std::shared_ptr<DataTable> DecodeParquet(const std::string &bytes) = 0;
};

} // namespace chhttp
