#include "chhttp/transport/client_factory.hpp"
#include "chhttp/transport/httplib_client.hpp"
#include "chhttp/util/proxy.hpp"

namespace chhttp {

std::shared_ptr<IHttpClient> CreateHttpClient(const OptionMap &options) {
	auto proxy_config = GetHttpProxyConfig(options);
	HttpTimeouts timeouts;
	timeouts.connectSeconds = GetIntOption(options, OPTION_CONNECT_TIMEOUT);
	timeouts.readSeconds = GetIntOption(options, OPTION_READ_TIMEOUT);
	return std::make_shared<HttpLibClient>(proxy_config, timeouts);
}

} // namespace chhttp
