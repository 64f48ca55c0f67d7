#include "gtest/gtest.h"

#include "dcmtk/config/osconfig.h"
#include "dcmtk/oflog/oflog.h"

int main(int argc, char **argv) {
	// keep the test output readable, components log every step at INFO
	OFLog::configure(OFLogger::FATAL_LOG_LEVEL);

	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
