#include <gtest/gtest.h>
#include <string>

#include "sandbox/CapacityGuard.h"
#include "TestSupport.h"

namespace {
  size_t countEntries(const fs::path& dir) {
    size_t n = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) n++;
    return n;
  }
}

TEST(CapacityGuard, FileAtLimitPassesOneByteMoreFails) {
  TempDir tmp("guard_limit");
  fs::path atLimit = tmp.write("ten.bin", std::string(10, 'x'));
  fs::path over = tmp.write("eleven.bin", std::string(11, 'x'));

  auto ok = CapacityGuard::checkSize(atLimit, 10);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok.value(), 10u);

  auto tooLarge = CapacityGuard::checkSize(over, 10);
  ASSERT_FALSE(tooLarge);
  EXPECT_EQ(tooLarge.error().code, SandboxErrorCode::TooLarge);
}

TEST(CapacityGuard, MissingFileIsNotFound) {
  TempDir tmp("guard_missing");
  auto r = CapacityGuard::checkSize(tmp.path() / "nope", 10);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, SandboxErrorCode::NotFound);
}

TEST(CapacityGuard, DirectoryIsNotReadable) {
  TempDir tmp("guard_dir");
  auto r = CapacityGuard::checkSize(tmp.path(), 1024);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, SandboxErrorCode::InvalidArgument);
}

TEST(CapacityGuard, WriteLengthCheckedAgainstCeiling) {
  CapacityGuard guard(100, 5);
  EXPECT_TRUE(guard.checkWriteSize(5));
  auto r = guard.checkWriteSize(6);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, SandboxErrorCode::TooLarge);
}

TEST(CapacityGuard, ReadBoundedReturnsBytes) {
  TempDir tmp("guard_read");
  std::string binary("a\0b\xff", 4);
  fs::path p = tmp.write("data.bin", binary);

  CapacityGuard guard(100, 100);
  auto r = guard.readBounded(p);
  ASSERT_TRUE(r);
  EXPECT_EQ(r.value(), binary);
}

TEST(CapacityGuard, ReadBoundedStopsAtCeiling) {
  TempDir tmp("guard_grow");
  fs::path p = tmp.write("big.txt", std::string(200, 'x'));

  CapacityGuard guard(100, 100);
  auto r = guard.readBounded(p);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, SandboxErrorCode::TooLarge);
}

TEST(CapacityGuard, WriteAtomicCreatesParentsAndLeavesNoTemporaries) {
  TempDir tmp("guard_write");
  CapacityGuard guard(100, 100);
  fs::path target = tmp.path() / "a" / "b" / "out.txt";

  auto r = guard.writeAtomic(target, "hello");
  ASSERT_TRUE(r) << r.error().message;
  EXPECT_EQ(r.value(), 5u);
  EXPECT_EQ(readAll(target), "hello");
  EXPECT_EQ(countEntries(target.parent_path()), 1u);
}

TEST(CapacityGuard, WriteAtomicReplacesExistingFile) {
  TempDir tmp("guard_replace");
  fs::path target = tmp.write("f.txt", "old content that is longer");
  CapacityGuard guard(100, 100);

  ASSERT_TRUE(guard.writeAtomic(target, "new"));
  EXPECT_EQ(readAll(target), "new");
}

#ifndef _WIN32
TEST(CapacityGuard, WriteAtomicKeepsExistingPermissions) {
  TempDir tmp("guard_perms");
  fs::path target = tmp.write("secret.txt", "old");
  fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
  CapacityGuard guard(100, 100);

  ASSERT_TRUE(guard.writeAtomic(target, "new"));
  EXPECT_EQ(readAll(target), "new");
  EXPECT_EQ(fs::status(target).permissions() & fs::perms::mask,
            fs::perms::owner_read | fs::perms::owner_write);
}
#endif

TEST(CapacityGuard, OversizedWriteTouchesNothing) {
  TempDir tmp("guard_oversize");
  CapacityGuard guard(100, 4);
  fs::path target = tmp.path() / "sub" / "f.txt";

  auto r = guard.writeAtomic(target, "12345");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, SandboxErrorCode::TooLarge);
  EXPECT_FALSE(fs::exists(target));
  EXPECT_FALSE(fs::exists(target.parent_path()));
}

TEST(CapacityGuard, RefusesToOverwriteDirectory) {
  TempDir tmp("guard_dirtarget");
  fs::path dir = tmp.mkdir("d");
  CapacityGuard guard(100, 100);

  auto r = guard.writeAtomic(dir, "x");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, SandboxErrorCode::InvalidArgument);
  EXPECT_TRUE(fs::is_directory(dir));
}
