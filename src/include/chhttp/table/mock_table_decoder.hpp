#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "chhttp/table/table_decoder.hpp"

namespace chhttp {

/**
 * Table decoder for tests. Returns a canned table, or throws DecodeException when one was
 * configured with SetFailure(). Every body it was asked to decode is recorded.
 */
class MockTableDecoder : public ITableDecoder {
public:
	explicit MockTableDecoder(bool available = true);

	void SetTable(std::shared_ptr<DataTable> table);
	void SetFailure(const std::string &message);

	bool IsAvailable() override;
	std::shared_ptr<DataTable> DecodeParquet(const std::string &bytes) override;

	std::vector<std::string> GetDecodedBodies() const;

private:
	mutable std::mutex mutex;
	bool available;
	std::shared_ptr<DataTable> table;
	std::string failure;
	std::vector<std::string> decodedBodies;
};

} // namespace chhttp
