#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace th;

namespace {
string readExactly(int fd, size_t count) {
  string retval;
  char buf[4096];
  while (retval.size() < count) {
    ssize_t rc =
        RawSocketUtils::readSome(fd, buf, min(sizeof(buf), count - retval.size()));
    retval.append(buf, rc);
  }
  return retval;
}
}  // namespace

TEST_CASE("RawSocketUtils writeAll writes all data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  const string payload = "test data for writeAll";
  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  REQUIRE(readExactly(fds[0], payload.size()) == payload);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll with large data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Bigger than a pipe buffer
  const size_t size = 1024 * 1024;
  string payload(size, 'X');

  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  REQUIRE(readExactly(fds[0], size) == payload);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils readSome returns 0 when nothing is ready",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  int flags = fcntl(fds[0], F_GETFL, 0);
  FATAL_FAIL(fcntl(fds[0], F_SETFL, flags | O_NONBLOCK));

  char buffer[16];
  REQUIRE(RawSocketUtils::readSome(fds[0], buffer, sizeof(buffer)) == 0);

  RawSocketUtils::writeAll(fds[1], "abc", 3);
  REQUIRE(RawSocketUtils::readSome(fds[0], buffer, sizeof(buffer)) == 3);
  REQUIRE(string(buffer, 3) == "abc");

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils readSome throws once the writer is gone",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[1]);

  char buffer[100];
  REQUIRE_THROWS_AS(RawSocketUtils::readSome(fds[0], buffer, sizeof(buffer)),
                    std::runtime_error);

  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll throws on closed socket",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);

  const string payload = "test data";
  REQUIRE_THROWS_AS(
      RawSocketUtils::writeAll(fds[1], payload.data(), payload.size()),
      std::runtime_error);

  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils rejects invalid descriptors", "[RawSocketUtils]") {
  char buffer[100];
  REQUIRE_THROWS(RawSocketUtils::writeAll(-1, "test", 4));
  REQUIRE_THROWS(RawSocketUtils::readSome(-1, buffer, sizeof(buffer)));
}
