#include "chhttp/request_builder.hpp"
#include "chhttp/exception.hpp"
#include "chhttp/formats.hpp"
#include "chhttp/param_encoder.hpp"
#include "chhttp/response_interpreter.hpp"
#include "chhttp/util/log.hpp"
#include "chhttp/util/url.hpp"

namespace chhttp {

HttpMethod ParseHttpMethod(const std::string &method) {
	if (EqualsIgnoreCase(method, "POST")) {
		return HttpMethod::POST;
	}
	if (EqualsIgnoreCase(method, "GET")) {
		return HttpMethod::GET;
	}
	throw ValidationException("method option must be GET or POST, got \"" + method + "\"");
}

QueryRequest BuildQueryRequest(QueryRequest base, const std::string &sql, const QueryParams &params,
                               const OptionMap &options, std::shared_ptr<ITableDecoder> decoder) {
	if (sql.empty()) {
		throw ValidationException("the sql query is required");
	}
	ValidateQueryOptions(options);

	QueryRequest request = std::move(base);
	request.options = MergeOptions(request.options, options);

	auto method = GetStringOption(request.options, OPTION_METHOD);
	if (!method.empty()) {
		request.method = ParseHttpMethod(method);
	}
	auto baseUrl = GetStringOption(request.options, OPTION_BASE_URL);
	if (!baseUrl.empty()) {
		request.baseUrl = baseUrl;
	}

	// Encode before touching the request so a bad parameter leaves it as it was.
	auto encodedParams = EncodeParamsQuery(params);

	if (request.method == HttpMethod::POST) {
		request.body = sql;
	} else {
		request.body.clear();
		AppendQuery(request.query, EncodeQuery({{"query", sql}}, UrlEncoding::WWW_FORM));
	}
	AppendQuery(request.query, encodedParams);

	request.PrependRequestStep(CLICKHOUSE_RUN_STEP,
	                           [decoder](QueryRequest &req) { RunClickHouseStep(req, decoder); });
	return request;
}

void RunClickHouseStep(QueryRequest &request, const std::shared_ptr<ITableDecoder> &decoder) {
	if (request.HasPrivate(FORMAT_PRIVATE_KEY)) {
		return;
	}

	auto token = GetStringOption(request.options, OPTION_FORMAT, DEFAULT_FORMAT);
	bool tableDecodingAvailable = decoder && decoder->IsAvailable();
	auto decision = ResolveFormat(token, tableDecodingAvailable);

	if (request.baseUrl.empty()) {
		request.baseUrl = DEFAULT_BASE_URL;
	}

	request.PutPrivate(FORMAT_PRIVATE_KEY, decision.format);
	PutHeader(request.headers, FORMAT_HEADER, decision.header);

	auto database = GetStringOption(request.options, OPTION_DATABASE);
	if (!database.empty()) {
		AppendQuery(request.query, EncodeQuery({{OPTION_DATABASE, database}}, UrlEncoding::RFC3986));
	}

	request.PrependResponseStep(CLICKHOUSE_RESULT_STEP, [decoder](const QueryRequest &req, QueryResponse &resp) {
		return HandleClickHouseResult(req, resp, decoder.get());
	});
	log::debug("format " + decision.format + " resolved, sending " + FORMAT_HEADER + ": " + decision.header);
}

} // namespace chhttp
