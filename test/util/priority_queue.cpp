#include "../fixtures/util.hpp"

#include <tessera/util/exception.hpp>
#include <tessera/util/priority_queue.hpp>

#include <string>
#include <vector>

using namespace tessera;
using namespace tessera::util;

namespace {

using Queue = PriorityQueue<int>;

std::string key(const int& value) {
    return std::to_string(value);
}

std::vector<int> drain(Queue& queue) {
    std::vector<int> values;
    while (!queue.isEmpty()) {
        values.push_back(queue.dequeue());
    }
    return values;
}

} // namespace

TEST(PriorityQueue, DequeuesLowestPriorityFirst) {
    Queue queue([](const int& value) { return double(value); }, key);
    for (int value : { 5, 3, 9, 1, 7, 2, 8, 0, 6, 4 }) {
        EXPECT_TRUE(queue.enqueue(value));
    }
    EXPECT_EQ(10u, queue.getCount());
    EXPECT_EQ((std::vector<int> { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 }), drain(queue));
    EXPECT_THROW(queue.dequeue(), MisuseException);
}

TEST(PriorityQueue, RejectsDropAndDuplicates) {
    Queue queue([](const int& value) { return value < 0 ? Queue::DROP : double(value); }, key);
    EXPECT_FALSE(queue.enqueue(-1));
    EXPECT_TRUE(queue.enqueue(1));
    EXPECT_FALSE(queue.enqueue(1));
    EXPECT_EQ(1u, queue.getCount());
    EXPECT_TRUE(queue.isKeyQueued("1"));
    EXPECT_TRUE(queue.isQueued(1));
    EXPECT_FALSE(queue.isKeyQueued("-1"));

    queue.dequeue();
    EXPECT_FALSE(queue.isKeyQueued("1"));
    EXPECT_TRUE(queue.enqueue(1));
}

TEST(PriorityQueue, Reprioritize) {
    double sign = 1;
    Queue queue([&](const int& value) { return value == 3 ? Queue::DROP : sign * value; }, key);
    for (int value : { 1, 2, 4, 5 }) {
        queue.enqueue(value);
    }
    queue.enqueue(3);
    EXPECT_EQ(4u, queue.getCount());

    sign = -1;
    queue.reprioritize();
    EXPECT_EQ((std::vector<int> { 5, 4, 2, 1 }), drain(queue));
}

TEST(PriorityQueue, ReprioritizeDrops) {
    std::vector<int> dropped;
    Queue queue([&](const int& value) {
        for (int d : dropped) {
            if (d == value) {
                return Queue::DROP;
            }
        }
        return double(value);
    }, key);
    for (int value : { 6, 5, 4, 3, 2, 1 }) {
        queue.enqueue(value);
    }

    dropped = { 1, 4, 6 };
    queue.reprioritize();
    EXPECT_EQ(3u, queue.getCount());
    EXPECT_FALSE(queue.isKeyQueued("4"));
    EXPECT_EQ((std::vector<int> { 2, 3, 5 }), drain(queue));
}

TEST(PriorityQueue, Clear) {
    Queue queue([](const int& value) { return double(value); }, key);
    queue.enqueue(1);
    queue.enqueue(2);
    queue.clear();
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_FALSE(queue.isKeyQueued("1"));
}
