#pragma once

#include <mutex>
#include <vector>

#include "chhttp/transport/http_client.hpp"
#include "chhttp/transport/http_type.hpp"

namespace chhttp {

class MockHttpClient : public IHttpClient {
public:
	HttpResponse Execute(const HttpRequest &request) override;
	void AddResponse(HttpResponse response);
	// The next Execute call throws TransportException with this message.
	void AddFailure(const std::string &message);
	// Safe to call while other threads are executing requests.
	std::vector<HttpRequest> GetRecordedRequests() const;

private:
	struct QueuedResponse {
		HttpResponse response;
		std::string failure;
	};

	mutable std::mutex mutex;
	size_t responseIndex = 0;
	std::vector<QueuedResponse> responses;
	std::vector<HttpRequest> recordedRequests;
};
} // namespace chhttp
