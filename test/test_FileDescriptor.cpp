#include "wpcsh/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace wpcsh;

TEST(FileDescriptor, DestructorClosesFd) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int r = fds[0];
  {
    FileDescriptor fd(r);
  }
  // already closed by the wrapper
  errno  = 0;
  int rc = close(r);
  EXPECT_EQ(rc, -1);
  EXPECT_EQ(errno, EBADF);
  close(fds[1]);
}

TEST(FileDescriptor, MoveConstruction) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  FileDescriptor writer(fds[1]);
  FileDescriptor a(fds[0]);
  FileDescriptor b(std::move(a));
  EXPECT_FALSE(a.valid());
  ASSERT_TRUE(b.valid());

  char c = 'x';
  ASSERT_EQ(write(writer.get(), &c, 1), 1) << std::strerror(errno);
  char buf{};
  ASSERT_EQ(read(b.get(), &buf, 1), 1) << std::strerror(errno);
  EXPECT_EQ(buf, 'x');
}

TEST(FileDescriptor, DefaultIsInvalid) {
  FileDescriptor fd;
  EXPECT_EQ(fd.get(), -1);
  EXPECT_FALSE(fd.valid());
}

TEST(FileDescriptor, MoveAssignmentClosesPrevious) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor a(fds[0]);
  FileDescriptor b(fds[1]);
  b = std::move(a);

  char data = 'x';
  errno     = 0;
  EXPECT_EQ(write(fds[1], &data, 1), -1);
  EXPECT_EQ(errno, EBADF);
  EXPECT_EQ(a.get(), -1);
  EXPECT_EQ(b.get(), fds[0]);
}

TEST(FileDescriptor, SelfMoveAssignment) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  int            original_fd = fd.get();

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wself-move"
  fd = std::move(fd);
#pragma GCC diagnostic pop

  EXPECT_EQ(fd.get(), original_fd);
  close(fds[1]);
}

TEST(FileDescriptor, Release) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  int            released = fd.release();
  EXPECT_EQ(released, fds[0]);
  EXPECT_EQ(fd.get(), -1);

  // caller owns it now
  EXPECT_EQ(close(released), 0);
  close(fds[1]);
}

TEST(FileDescriptor, ResetClosesAndInvalidates) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  fd.reset();
  EXPECT_FALSE(fd.valid());
  errno = 0;
  EXPECT_EQ(close(fds[0]), -1);
  EXPECT_EQ(errno, EBADF);
  fd.reset();
  close(fds[1]);
}

TEST(FileDescriptor, MakePipeIsCloseOnExec) {
  auto pipe = makePipe();
  ASSERT_TRUE(pipe.has_value()) << pipe.error().message();
  ASSERT_TRUE(pipe->read_end_.valid());
  ASSERT_TRUE(pipe->write_end_.valid());
  EXPECT_NE(fcntl(pipe->read_end_.get(), F_GETFD) & FD_CLOEXEC, 0);
  EXPECT_NE(fcntl(pipe->write_end_.get(), F_GETFD) & FD_CLOEXEC, 0);

  char const msg[] = "hi";
  ASSERT_EQ(write(pipe->write_end_.get(), msg, 2), 2);
  pipe->write_end_.reset();

  std::array<char, 8> buf{};
  EXPECT_EQ(read(pipe->read_end_.get(), buf.data(), buf.size()), 2);
  EXPECT_EQ(read(pipe->read_end_.get(), buf.data(), buf.size()), 0);
  EXPECT_STREQ(buf.data(), "hi");
}
