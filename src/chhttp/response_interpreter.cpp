#include "chhttp/response_interpreter.hpp"
#include "chhttp/exception.hpp"
#include "chhttp/formats.hpp"
#include "chhttp/util/log.hpp"

namespace chhttp {

StepResult HandleClickHouseResult(const QueryRequest &request, QueryResponse &response, ITableDecoder *decoder) {
	if (response.statusCode != 200) {
		return StepResult::CONTINUE;
	}
	if (request.GetPrivate(FORMAT_PRIVATE_KEY) != FORMAT_DATAFRAME) {
		return StepResult::CONTINUE;
	}

	auto echoed = GetHeaderValues(response.headers, FORMAT_HEADER);
	if (echoed.size() != 1 || echoed.front() != FORMAT_PARQUET) {
		std::string got;
		for (const auto &value : echoed) {
			got += (got.empty() ? "" : ", ") + value;
		}
		log::debug("format overridden by the query (" + std::string(FORMAT_HEADER) + ": " + got +
		           "), leaving the body undecoded");
		return StepResult::CONTINUE;
	}

	if (!decoder || !decoder->IsAvailable()) {
		throw MissingDependencyException(MissingTableDecoderMessage());
	}

	response.table = decoder->DecodeParquet(response.body);
	response.body.clear();
	return StepResult::HALT;
}

} // namespace chhttp
