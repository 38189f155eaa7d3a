#include "classification/core/logging.hpp"

#include <gtest/gtest.h>

int main(int argc, char** argv) {
	::testing::InitGoogleTest(&argc, argv);
	geolabel::classification::core::initLogging({"warn", ""});
	return RUN_ALL_TESTS();
}
