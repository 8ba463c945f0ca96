#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chhttp/table/data_table.hpp"
#include "chhttp/transport/http_type.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

enum class StepResult {
	CONTINUE,
	// Skip every response step that has not run yet.
	HALT
};

struct QueryResponse {
	int statusCode = 0;
	HttpHeaders headers;
	// Raw body. Cleared when it was decoded into a table.
	std::string body;
	// Set by the decode_body step for application/json bodies.
	nlohmann::json json;
	// Set when a Parquet body was decoded into a table.
	std::shared_ptr<DataTable> table;

	bool HasTable() const {
		return table != nullptr;
	}

	bool HasJson() const {
		return !json.is_null();
	}

	bool IsSuccess() const {
		return statusCode >= 200 && statusCode < 300;
	}

	// Throws ServerException carrying the status and the raw body unless the status is 2xx.
	void EnsureSuccess() const;
};

struct QueryRequest;

using RequestStepFn = std::function<void(QueryRequest &)>;
using ResponseStepFn = std::function<StepResult(const QueryRequest &, QueryResponse &)>;

struct RequestStep {
	std::string name;
	RequestStepFn fn;
};

struct ResponseStep {
	std::string name;
	ResponseStepFn fn;
};

/**
 * A query on its way through the pipeline. Request steps shape it before it is sent; response steps
 * post-process what came back. Each query owns its request, so nothing here is shared between calls.
 */
struct QueryRequest {
	HttpMethod method = HttpMethod::POST;
	std::string baseUrl;
	// Percent-encoded query string without the leading '?'.
	std::string query;
	HttpHeaders headers;
	std::string body;
	OptionMap options;
	std::map<std::string, std::string> privateData;
	std::vector<RequestStep> requestSteps;
	std::vector<ResponseStep> responseSteps;

	bool HasPrivate(const std::string &key) const;
	std::string GetPrivate(const std::string &key) const;
	void PutPrivate(const std::string &key, const std::string &value);

	void AppendRequestStep(const std::string &name, RequestStepFn fn);
	void PrependRequestStep(const std::string &name, RequestStepFn fn);
	void AppendResponseStep(const std::string &name, ResponseStepFn fn);
	void PrependResponseStep(const std::string &name, ResponseStepFn fn);

	bool HasResponseStep(const std::string &name) const;

	// Full URL, including the query string.
	std::string Url() const;
	HttpRequest ToHttpRequest() const;
};

} // namespace chhttp
