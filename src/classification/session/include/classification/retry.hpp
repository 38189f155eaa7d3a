#pragma once

#include "classification/core/errors.hpp"
#include "classification/core/logging.hpp"

#include <string_view>

namespace geolabel::classification {

/*! Run a read or write of a project artifact.
 *  A PersistenceError is logged and the call repeated once. A second PersistenceError propagates. Other errors propagate immediately.
 */
template<typename Fn>
auto retryOnce(std::string_view artifact, Fn&& fn) -> decltype(fn()) {
	try {
		return fn();
	} catch (const core::PersistenceError& e) {
		core::logger()->warn("Persistence failure on '{}': {}. Retrying once.", artifact, e.what());
	}

	try {
		return fn();
	} catch (const core::PersistenceError& e) {
		core::logger()->error("Persistence failure on '{}' after retry: {}", artifact, e.what());
		throw;
	}
}

} // namespace geolabel::classification
