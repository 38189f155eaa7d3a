#include "classification/core/errors.hpp"

namespace geolabel::classification::core {

std::string_view toString(const ErrorKind kind) {
	switch (kind) {
	case ErrorKind::InsufficientLabels:
		return "InsufficientLabelsError";
	case ErrorKind::UnknownMethod:
		return "UnknownMethodError";
	case ErrorKind::FeatureDimensionMismatch:
		return "FeatureDimensionMismatchError";
	case ErrorKind::Persistence:
		return "PersistenceError";
	case ErrorKind::UnknownSegment:
		return "UnknownSegmentError";
	case ErrorKind::InvalidClass:
		return "InvalidClassError";
	case ErrorKind::InvalidTransition:
		return "InvalidTransitionError";
	case ErrorKind::UnknownProject:
		return "UnknownProjectError";
	case ErrorKind::Cancelled:
		return "PropagationCancelledError";
	case ErrorKind::Internal:
		return "InternalError";
	}
	return "Error";
}

Error::Error(const ErrorKind kind, const std::string& message) : std::runtime_error(message), m_kind{kind} {
}

} // namespace geolabel::classification::core
