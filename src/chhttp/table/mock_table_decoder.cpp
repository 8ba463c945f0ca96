#include "chhttp/table/mock_table_decoder.hpp"
#include "chhttp/exception.hpp"

namespace chhttp {

MockTableDecoder::MockTableDecoder(bool available) : available(available), table(std::make_shared<DataTable>()) {
}

void MockTableDecoder::SetTable(std::shared_ptr<DataTable> table) {
	this->table = std::move(table);
}

void MockTableDecoder::SetFailure(const std::string &message) {
	failure = message;
}

bool MockTableDecoder::IsAvailable() {
	return available;
}

std::shared_ptr<DataTable> MockTableDecoder::DecodeParquet(const std::string &bytes) {
	std::lock_guard<std::mutex> lock(mutex);
	decodedBodies.push_back(bytes);
	if (!failure.empty()) {
		throw DecodeException(failure);
	}
	return table;
}

std::vector<std::string> MockTableDecoder::GetDecodedBodies() const {
	std::lock_guard<std::mutex> lock(mutex);
	return decodedBodies;
}

} // namespace chhttp
