#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace geolabel::classification::core {

//! Stable error category reported across the service boundary.
enum class ErrorKind {
	InsufficientLabels,       //!< Fewer than two labeled classes at propagation time.
	UnknownMethod,            //!< Propagation method name not in the closed set.
	FeatureDimensionMismatch, //!< Ragged or non-finite feature table.
	Persistence,              //!< Read/write failure on project artifacts.
	UnknownSegment,           //!< Segment id not present in the feature table.
	InvalidClass,             //!< Empty class name.
	InvalidTransition,        //!< Operation not valid in the current session state.
	UnknownProject,           //!< Project id not found or malformed.
	Cancelled,                //!< Propagation superseded by a newer request.
	Internal,                 //!< Unexpected failure of an underlying library (OpenCV, allocation).
};

std::string_view toString(ErrorKind kind);

//! Base for every error raised by the engine. Carries the stable kind next to the message.
class Error : public std::runtime_error {
public:
	Error(ErrorKind kind, const std::string& message);

	ErrorKind kind() const noexcept {
		return m_kind;
	}

private:
	ErrorKind m_kind;
};

class InsufficientLabelsError : public Error {
public:
	explicit InsufficientLabelsError(const std::string& message) : Error(ErrorKind::InsufficientLabels, message) {
	}
};

class UnknownMethodError : public Error {
public:
	explicit UnknownMethodError(const std::string& message) : Error(ErrorKind::UnknownMethod, message) {
	}
};

class FeatureDimensionMismatchError : public Error {
public:
	explicit FeatureDimensionMismatchError(const std::string& message) : Error(ErrorKind::FeatureDimensionMismatch, message) {
	}
};

class PersistenceError : public Error {
public:
	explicit PersistenceError(const std::string& message) : Error(ErrorKind::Persistence, message) {
	}
};

class UnknownSegmentError : public Error {
public:
	explicit UnknownSegmentError(const std::string& message) : Error(ErrorKind::UnknownSegment, message) {
	}
};

class InvalidClassError : public Error {
public:
	explicit InvalidClassError(const std::string& message) : Error(ErrorKind::InvalidClass, message) {
	}
};

class InvalidTransitionError : public Error {
public:
	explicit InvalidTransitionError(const std::string& message) : Error(ErrorKind::InvalidTransition, message) {
	}
};

class UnknownProjectError : public Error {
public:
	explicit UnknownProjectError(const std::string& message) : Error(ErrorKind::UnknownProject, message) {
	}
};

class PropagationCancelledError : public Error {
public:
	explicit PropagationCancelledError(const std::string& message) : Error(ErrorKind::Cancelled, message) {
	}
};

class InternalError : public Error {
public:
	explicit InternalError(const std::string& message) : Error(ErrorKind::Internal, message) {
	}
};

} // namespace geolabel::classification::core
