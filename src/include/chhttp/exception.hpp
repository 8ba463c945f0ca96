#pragma once

#include <stdexcept>
#include <string>

namespace chhttp {

class ChHttpException : public std::runtime_error {
public:
	explicit ChHttpException(const std::string &message) : std::runtime_error(message) {
	}
};

// Raised before any I/O: bad format token, missing SQL, duplicate parameter, bad option.
class ValidationException : public ChHttpException {
public:
	explicit ValidationException(const std::string &message) : ChHttpException(message) {
	}
};

class MissingDependencyException : public ChHttpException {
public:
	explicit MissingDependencyException(const std::string &message) : ChHttpException(message) {
	}
};

class TransportException : public ChHttpException {
public:
	explicit TransportException(const std::string &message) : ChHttpException(message) {
	}
};

class DecodeException : public ChHttpException {
public:
	explicit DecodeException(const std::string &message) : ChHttpException(message) {
	}
};

class ServerException : public ChHttpException {
public:
	ServerException(int statusCode, const std::string &serverMessage)
	    : ChHttpException("ClickHouse server error (" + std::to_string(statusCode) + "): " + serverMessage),
	      statusCode(statusCode), serverMessage(serverMessage) {
	}

	int GetStatusCode() const {
		return statusCode;
	}

	const std::string &GetServerMessage() const {
		return serverMessage;
	}

private:
	int statusCode;
	std::string serverMessage;
};

} // namespace chhttp
