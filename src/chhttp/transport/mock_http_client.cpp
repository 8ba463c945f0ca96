#include "chhttp/transport/mock_http_client.hpp"
#include "chhttp/exception.hpp"

#include <stdexcept>

namespace chhttp {

HttpResponse MockHttpClient::Execute(const HttpRequest &request) {
	std::lock_guard<std::mutex> lock(mutex);
	recordedRequests.push_back(request);
	if (responseIndex >= responses.size()) {
		throw std::runtime_error("MockHttpClient: No more responses queued");
	}
	const auto &queued = responses[responseIndex++];
	if (!queued.failure.empty()) {
		throw TransportException(queued.failure);
	}
	return queued.response;
}

void MockHttpClient::AddResponse(HttpResponse response) {
	std::lock_guard<std::mutex> lock(mutex);
	responses.push_back(QueuedResponse {std::move(response), ""});
}

void MockHttpClient::AddFailure(const std::string &message) {
	std::lock_guard<std::mutex> lock(mutex);
	responses.push_back(QueuedResponse {HttpResponse {0, {}, ""}, message});
}

std::vector<HttpRequest> MockHttpClient::GetRecordedRequests() const {
	std::lock_guard<std::mutex> lock(mutex);
	return recordedRequests;
}
} // namespace chhttp
