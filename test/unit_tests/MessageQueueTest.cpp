#include "MessageQueue.hpp"

#include "TestHeaders.hpp"

using namespace st;

TEST_CASE("MessageQueue", "[MessageQueue]") {
  MessageQueue<int> queue(2);
  shared_ptr<CancellationToken> token(new CancellationToken());
  int value = 0;

  SECTION("Items come out in order") {
    REQUIRE(queue.push(1, token));
    REQUIRE(queue.push(2, token));
    REQUIRE(queue.size() == 2);
    REQUIRE(queue.pop(&value, token));
    REQUIRE(value == 1);
    REQUIRE(queue.tryPop(&value));
    REQUIRE(value == 2);
    REQUIRE(queue.tryPop(&value) == false);
  }

  SECTION("tryPush respects capacity") {
    REQUIRE(queue.tryPush(1));
    REQUIRE(queue.tryPush(2));
    REQUIRE(queue.tryPush(3) == false);
    REQUIRE(queue.size() == 2);
  }

  SECTION("popFor times out") {
    auto start = std::chrono::steady_clock::now();
    REQUIRE(queue.popFor(&value, std::chrono::milliseconds(50)) == false);
    REQUIRE(std::chrono::steady_clock::now() - start >=
            std::chrono::milliseconds(40));
  }

  SECTION("Closing wakes a blocked consumer") {
    std::thread closer([&queue]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      queue.close();
    });
    REQUIRE(queue.pop(&value, token) == false);
    closer.join();
    REQUIRE(queue.isClosed());
    REQUIRE(queue.isDrained());
  }

  SECTION("Queued items survive a close") {
    REQUIRE(queue.push(7, token));
    queue.close();
    REQUIRE(queue.isDrained() == false);
    REQUIRE(queue.push(8, token) == false);
    REQUIRE(queue.pop(&value, token));
    REQUIRE(value == 7);
    REQUIRE(queue.isDrained());
  }

  SECTION("Cancellation unblocks a full push") {
    REQUIRE(queue.push(1, token));
    REQUIRE(queue.push(2, token));
    std::thread canceller([token]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      token->cancel();
    });
    REQUIRE(queue.push(3, token) == false);
    canceller.join();
    REQUIRE(queue.size() == 2);
  }

  SECTION("Blocked producer resumes when space frees up") {
    REQUIRE(queue.push(1, token));
    REQUIRE(queue.push(2, token));
    std::thread consumer([&queue]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      int item;
      queue.tryPop(&item);
    });
    REQUIRE(queue.push(3, token));
    consumer.join();
    REQUIRE(queue.size() == 2);
  }
}

TEST_CASE("CancellationToken", "[MessageQueue]") {
  shared_ptr<CancellationToken> parent(new CancellationToken());
  shared_ptr<CancellationToken> child(new CancellationToken(parent));

  SECTION("Children follow their parent") {
    REQUIRE(child->isCancelled() == false);
    parent->cancel();
    REQUIRE(child->isCancelled());
  }

  SECTION("Cancelling a child leaves the parent running") {
    child->cancel();
    REQUIRE(child->isCancelled());
    REQUIRE(parent->isCancelled() == false);
  }

  SECTION("waitFor returns early on cancellation") {
    REQUIRE(child->waitFor(std::chrono::milliseconds(10)) == false);
    std::thread canceller([parent]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      parent->cancel();
    });
    auto start = std::chrono::steady_clock::now();
    REQUIRE(child->waitFor(std::chrono::seconds(10)));
    REQUIRE(std::chrono::steady_clock::now() - start <
            std::chrono::seconds(5));
    canceller.join();
  }
}
