#include <algorithm>
#include <cctype>

#include "chhttp/exception.hpp"
#include "chhttp/pipeline.hpp"
#include "chhttp/util/log.hpp"

namespace chhttp {

QueryResponse RunPipeline(QueryRequest &request, IHttpClient &http) {
	// Indexed loops: a step may append steps to the list it is iterating.
	for (size_t i = 0; i < request.requestSteps.size(); i++) {
		auto step = request.requestSteps[i];
		step.fn(request);
	}

	auto httpRequest = request.ToHttpRequest();
	log::debug(std::string(HttpMethodToString(httpRequest.method)) + " " + httpRequest.url);
	auto httpResponse = http.Execute(httpRequest);

	QueryResponse response;
	response.statusCode = httpResponse.statusCode;
	response.headers = std::move(httpResponse.headers);
	response.body = std::move(httpResponse.body);

	for (size_t i = 0; i < request.responseSteps.size(); i++) {
		auto step = request.responseSteps[i];
		if (step.fn(request, response) == StepResult::HALT) {
			log::debug("response step " + step.name + " halted the pipeline");
			break;
		}
	}
	return response;
}

std::string MediaType(const std::string &contentType) {
	auto end = contentType.find(';');
	std::string media = contentType.substr(0, end);
	auto first = media.find_first_not_of(" \t");
	if (first == std::string::npos) {
		return "";
	}
	auto last = media.find_last_not_of(" \t");
	media = media.substr(first, last - first + 1);
	std::transform(media.begin(), media.end(), media.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return media;
}

StepResult DecodeJsonBody(const QueryRequest &request, QueryResponse &response) {
	if (!GetBoolOption(request.options, OPTION_DECODE_BODY, true).first) {
		return StepResult::CONTINUE;
	}
	if (response.body.empty() || MediaType(GetHeader(response.headers, "Content-Type")) != "application/json") {
		return StepResult::CONTINUE;
	}
	try {
		response.json = nlohmann::json::parse(response.body);
	} catch (const nlohmann::json::parse_error &e) {
		throw DecodeException("Failed to decode JSON body: " + std::string(e.what()));
	}
	return StepResult::CONTINUE;
}

} // namespace chhttp
