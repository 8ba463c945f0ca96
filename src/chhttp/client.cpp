#include "chhttp/client.hpp"
#include "chhttp/auth/auth_factory.hpp"
#include "chhttp/exception.hpp"
#include "chhttp/pipeline.hpp"
#include "chhttp/request_builder.hpp"
#include "chhttp/table/duckdb_table_decoder.hpp"
#include "chhttp/transport/client_factory.hpp"
#include "chhttp/util/log.hpp"
#include "chhttp/util/version.hpp"

namespace chhttp {

static bool HasCredentialOption(const OptionMap &options) {
	return options.count(OPTION_USER) || options.count(OPTION_PASSWORD) || options.count(OPTION_TOKEN);
}

ClickHouseClient::ClickHouseClient(std::shared_ptr<IHttpClient> http, OptionMap options,
                                   std::shared_ptr<IAuthProvider> auth, std::shared_ptr<ITableDecoder> decoder,
                                   HttpHeaders headers)
    : http(std::move(http)), options(std::move(options)), auth(std::move(auth)), decoder(std::move(decoder)),
      headers(std::move(headers)) {
	if (!this->http) {
		throw ValidationException("an HTTP client is required");
	}
	ValidateOptions(this->options);
}

HttpHeaders ClickHouseClient::BuildHeaders(IAuthProvider *auth, const HttpHeaders &custom) {
	HttpHeaders h;
	std::string version = getVersion();
	PutHeader(h, "User-Agent", "chhttp/" + (version.empty() ? "dev" : version));
	if (auth) {
		PutHeader(h, "Authorization", auth->GetAuthorizationHeader());
	}
	// Custom headers replace the defaults of the same name; repeated custom headers are all kept.
	for (const auto &header : custom) {
		h.erase(header.first);
	}
	for (const auto &header : custom) {
		AddHeader(h, header.first, header.second);
	}
	return h;
}

QueryRequest ClickHouseClient::BuildRequest(const std::string &sql, const QueryParams &params,
                                            const OptionMap &overrides) const {
	ValidateQueryOptions(overrides);

	// Credentials passed with the query replace the client's.
	std::shared_ptr<IAuthProvider> queryAuth = auth;
	if (HasCredentialOption(overrides)) {
		queryAuth = CreateAuthFromOptions(MergeOptions(options, overrides));
	}

	QueryRequest base;
	base.options = options;
	base.headers = BuildHeaders(queryAuth.get(), headers);
	if (GetBoolOption(MergeOptions(options, overrides), OPTION_DECODE_BODY, true).first) {
		base.AppendResponseStep(DECODE_BODY_STEP, DecodeJsonBody);
	}
	return BuildQueryRequest(std::move(base), sql, params, overrides, decoder);
}

QueryResponse ClickHouseClient::Query(const std::string &sql, const QueryParams &params,
                                      const OptionMap &overrides) const {
	auto request = BuildRequest(sql, params, overrides);
	auto response = RunPipeline(request, *http);
	log::debug("query finished with status " + std::to_string(response.statusCode));
	return response;
}

QueryResult ClickHouseClient::TryQuery(const std::string &sql, const QueryParams &params,
                                       const OptionMap &overrides) const {
	QueryResult result;
	try {
		result.response = Query(sql, params, overrides);
	} catch (const ValidationException &e) {
		result.errorType = ErrorType::VALIDATION;
		result.error = e.what();
	} catch (const MissingDependencyException &e) {
		result.errorType = ErrorType::MISSING_DEPENDENCY;
		result.error = e.what();
	} catch (const TransportException &e) {
		result.errorType = ErrorType::TRANSPORT;
		result.error = e.what();
	} catch (const DecodeException &e) {
		result.errorType = ErrorType::DECODE;
		result.error = e.what();
	}
	return result;
}

std::unique_ptr<ClickHouseClient> BuildClient(const OptionMap &options, const HttpHeaders &headers) {
	ValidateOptions(options);
	auto http = CreateHttpClient(options);
	auto auth = CreateAuthFromOptions(options);
	auto decoder = std::make_shared<DuckDBTableDecoder>();
	return std::make_unique<ClickHouseClient>(http, options, auth, decoder, headers);
}

} // namespace chhttp
