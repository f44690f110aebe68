#include "capture/channel.hpp"
#include <doctest/doctest.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace channel {
using whohas::capture::Channel;
using namespace std::chrono_literals;

TEST_CASE("Channel::items come out in order") {
  Channel<int> channel(3);
  CHECK(channel.send(1));
  CHECK(channel.send(2));
  CHECK(channel.size() == 2);

  CHECK(channel.receive() == 1);
  CHECK(channel.receive() == 2);
  CHECK(channel.size() == 0);
}

TEST_CASE("Channel::zero capacity is rejected") {
  CHECK_THROWS_AS(Channel<int>(0), std::invalid_argument);
}

TEST_CASE("Channel::receive_for times out on an empty channel") {
  Channel<int> channel(1);
  CHECK_FALSE(channel.receive_for(10ms).has_value());
  CHECK_FALSE(channel.finished());
}

TEST_CASE("Channel::closing drains what was sent") {
  Channel<int> channel(2);
  channel.send(7);
  channel.close();

  CHECK_FALSE(channel.send(8));
  CHECK_FALSE(channel.finished());
  CHECK(channel.receive() == 7);
  CHECK_FALSE(channel.receive().has_value());
  CHECK(channel.finished());
}

TEST_CASE("Channel::a full channel blocks the sender") {
  Channel<int> channel(1);
  channel.send(1);

  std::thread producer([&channel] {
    for (int i = 2; i <= 5; ++i) {
      channel.send(i);
    }
    channel.close();
  });

  std::vector<int> received;
  while (auto item = channel.receive()) {
    CHECK(channel.size() <= 1);
    received.push_back(*item);
  }
  producer.join();

  CHECK((received == std::vector<int>{1, 2, 3, 4, 5}));
}

TEST_CASE("Channel::close wakes a blocked sender") {
  Channel<int> channel(1);
  channel.send(1);

  bool sent = true;
  std::thread producer([&] { sent = channel.send(2); });
  std::this_thread::sleep_for(20ms);
  channel.close();
  producer.join();

  CHECK_FALSE(sent);
}

} // namespace channel
