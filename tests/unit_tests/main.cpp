#include "gtest/gtest.h"

#include "epee/misc_log_ex.h"

int main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);

  mlog_configure("", true);
  mlog_set_log("0");

  return RUN_ALL_TESTS();
}
