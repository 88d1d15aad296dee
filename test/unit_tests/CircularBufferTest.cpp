#include "CircularBuffer.hpp"

#include "TestHeaders.hpp"

using namespace th;

TEST_CASE("CircularBuffer keeps the most recent items", "[CircularBuffer]") {
  CircularBuffer<string> buffer(3);

  SECTION("Empty buffer") {
    REQUIRE(buffer.empty());
    REQUIRE(buffer.size() == 0);
    REQUIRE(!buffer.shift());
    REQUIRE(buffer.drain().empty());
  }

  SECTION("Push under capacity") {
    buffer.push("a");
    buffer.push("b");
    REQUIRE(buffer.size() == 2);
    REQUIRE(buffer.getAll() == vector<string>({"a", "b"}));
    REQUIRE(buffer.evictedCount() == 0);
  }

  SECTION("Overflow evicts the oldest, order preserved") {
    for (int i = 0; i < 10; i++) {
      buffer.push(to_string(i));
    }
    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.getAll() == vector<string>({"7", "8", "9"}));
    REQUIRE(buffer.evictedCount() == 7);
  }

  SECTION("Shift consumes from the front") {
    buffer.push("a");
    buffer.push("b");
    REQUIRE(*buffer.shift() == "a");
    REQUIRE(buffer.getAll() == vector<string>({"b"}));
  }

  SECTION("Drain empties the buffer") {
    buffer.push("a");
    buffer.push("b");
    buffer.push("c");
    buffer.push("d");
    REQUIRE(buffer.drain() == vector<string>({"b", "c", "d"}));
    REQUIRE(buffer.empty());
    buffer.push("e");
    REQUIRE(buffer.getAll() == vector<string>({"e"}));
  }

  SECTION("Clear") {
    buffer.push("a");
    buffer.clear();
    REQUIRE(buffer.empty());
    REQUIRE(buffer.capacity() == 3);
  }
}

TEST_CASE("CircularBuffer rejects zero capacity", "[CircularBuffer]") {
  REQUIRE_THROWS_AS(CircularBuffer<int>(0), std::invalid_argument);
}

TEST_CASE("CircularBuffer with concurrent producers", "[CircularBuffer]") {
  CircularBuffer<int> buffer(100);
  vector<thread> producers;
  for (int t = 0; t < 4; t++) {
    producers.emplace_back([&buffer, t]() {
      for (int i = 0; i < 1000; i++) {
        buffer.push(t * 1000 + i);
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  REQUIRE(buffer.size() == 100);
  REQUIRE(buffer.evictedCount() == 3900);

  // Each producer's items stay in its own push order
  map<int, int> lastSeen;
  for (int value : buffer.getAll()) {
    int producer = value / 1000;
    if (lastSeen.count(producer)) {
      REQUIRE(value > lastSeen[producer]);
    }
    lastSeen[producer] = value;
  }
}
