#include "chhttp/request.hpp"
#include "chhttp/exception.hpp"
#include "chhttp/util/url.hpp"

namespace chhttp {

void QueryResponse::EnsureSuccess() const {
	if (!IsSuccess()) {
		throw ServerException(statusCode, body);
	}
}

bool QueryRequest::HasPrivate(const std::string &key) const {
	return privateData.find(key) != privateData.end();
}

std::string QueryRequest::GetPrivate(const std::string &key) const {
	auto it = privateData.find(key);
	return it == privateData.end() ? "" : it->second;
}

void QueryRequest::PutPrivate(const std::string &key, const std::string &value) {
	privateData[key] = value;
}

void QueryRequest::AppendRequestStep(const std::string &name, RequestStepFn fn) {
	requestSteps.push_back({name, std::move(fn)});
}

void QueryRequest::PrependRequestStep(const std::string &name, RequestStepFn fn) {
	requestSteps.insert(requestSteps.begin(), {name, std::move(fn)});
}

void QueryRequest::AppendResponseStep(const std::string &name, ResponseStepFn fn) {
	responseSteps.push_back({name, std::move(fn)});
}

void QueryRequest::PrependResponseStep(const std::string &name, ResponseStepFn fn) {
	responseSteps.insert(responseSteps.begin(), {name, std::move(fn)});
}

bool QueryRequest::HasResponseStep(const std::string &name) const {
	for (const auto &step : responseSteps) {
		if (step.name == name) {
			return true;
		}
	}
	return false;
}

std::string QueryRequest::Url() const {
	return JoinUrl(baseUrl, query);
}

HttpRequest QueryRequest::ToHttpRequest() const {
	HttpRequest request;
	request.method = method;
	request.url = Url();
	request.headers = headers;
	request.body = body;
	return request;
}

} // namespace chhttp
