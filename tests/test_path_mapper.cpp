#include <gtest/gtest.h>
#include "path_mapper.hpp"

TEST(PathMapper, PosixPathsPassThrough) {
    PosixPathMapper mapper;
    EXPECT_EQ(mapper.to_mount_source("/tmp/codeguard-abc123"), "/tmp/codeguard-abc123");
}

TEST(PathMapper, WindowsDriveBecomesLowercaseRoot) {
    WindowsPathMapper mapper;
    EXPECT_EQ(mapper.to_mount_source("C:\\Users\\dev\\AppData\\Local\\Temp\\codeguard-x"),
              "/c/Users/dev/AppData/Local/Temp/codeguard-x");
    EXPECT_EQ(mapper.to_mount_source("d:/scratch"), "/d/scratch");
}

TEST(PathMapper, WindowsPathWithoutDriveOnlySwapsSeparators) {
    WindowsPathMapper mapper;
    EXPECT_EQ(mapper.to_mount_source("\\\\server\\share"), "//server/share");
}

TEST(PathMapper, FactoryMatchesHost) {
    auto mapper = make_host_path_mapper();
    ASSERT_NE(mapper, nullptr);
#ifndef _WIN32
    EXPECT_EQ(mapper->to_mount_source("/var/tmp/x"), "/var/tmp/x");
#endif
}
