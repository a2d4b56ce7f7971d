#include "testing/testing.hpp"

#include "base/logging.hpp"

int main(int argc, char * argv[])
{
#ifndef GEOLOCATOR_UNIT_TEST_KEEP_DEFAULT_LOG
  base::SetLogMessageFn(&base::LogMessageTests);
#endif

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
