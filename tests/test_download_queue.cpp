/**
 * test_download_queue.cpp
 *
 * FIFO order, de-duplication and head re-insertion of DownloadQueue.
 */

#include "TestSupport.hpp"
#include "core/downloads/DownloadQueue.hpp"

using namespace kitzi::test;

namespace {

QueueEntry entry(const std::string& itemId, const std::string& title = "") {
    return QueueEntry{itemId, std::nullopt, title};
}

std::string order(const DownloadQueue& queue) {
    std::string result;
    for (const auto& e : queue.entries()) {
        if (!result.empty()) result += ",";
        result += e.itemId;
    }
    return result;
}

} // namespace

bool TestFifoOrder() {
    std::cout << "Testing FIFO order..." << std::endl;

    DownloadQueue queue;
    ASSERT_TRUE(queue.empty(), "New queue is empty");
    ASSERT_TRUE(queue.push(entry("a")), "Push a");
    ASSERT_TRUE(queue.push(entry("b")), "Push b");
    ASSERT_TRUE(queue.push(entry("c")), "Push c");
    ASSERT_EQ(order(queue), std::string("a,b,c"), "Insertion order");

    auto head = queue.pop();
    ASSERT_TRUE(head.has_value(), "Pop returns the head");
    ASSERT_EQ(head->itemId, std::string("a"), "Head is a");
    ASSERT_EQ(queue.size(), size_t(2), "Two left");

    queue.pop();
    queue.pop();
    ASSERT_FALSE(queue.pop().has_value(), "Pop on empty queue");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestDuplicatesRejected() {
    std::cout << "Testing an item is queued at most once..." << std::endl;

    DownloadQueue queue;
    queue.push(entry("a", "First title"));
    queue.push(entry("b"));
    ASSERT_FALSE(queue.push(entry("a", "Second title")), "Duplicate rejected");
    ASSERT_EQ(queue.size(), size_t(2), "Size unchanged");
    ASSERT_EQ(queue.entries().front().title, std::string("First title"), "Original entry kept");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestPushFront() {
    std::cout << "Testing re-insertion at the head..." << std::endl;

    DownloadQueue queue;
    queue.push(entry("a"));
    queue.push(entry("b"));

    queue.pushFront(entry("c"));
    ASSERT_EQ(order(queue), std::string("c,a,b"), "New entry at head");

    queue.pushFront(entry("b"));
    ASSERT_EQ(order(queue), std::string("b,c,a"), "Existing entry moved to head");
    ASSERT_EQ(queue.size(), size_t(3), "No duplicate created");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestRemoveAndClear() {
    std::cout << "Testing remove and clear..." << std::endl;

    DownloadQueue queue;
    queue.push(entry("a"));
    queue.push(entry("b"));
    queue.push(entry("c"));

    ASSERT_TRUE(queue.remove("b"), "Remove b");
    ASSERT_FALSE(queue.remove("b"), "Second remove is a no-op");
    ASSERT_FALSE(queue.contains("b"), "b gone");
    ASSERT_EQ(order(queue), std::string("a,c"), "Order of the rest kept");

    queue.clear();
    ASSERT_TRUE(queue.empty(), "Cleared");
    ASSERT_TRUE(queue.push(entry("a")), "Can push again after clear");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " Download Queue Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestFifoOrder, "FIFO order");
    run_test(TestDuplicatesRejected, "Duplicates rejected");
    run_test(TestPushFront, "Push front");
    run_test(TestRemoveAndClear, "Remove and clear");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
