#ifndef TESSERA_UTIL_PRIORITY_QUEUE
#define TESSERA_UTIL_PRIORITY_QUEUE

#include <tessera/util/exception.hpp>

#include <functional>
#include <limits>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tessera {
namespace util {

// Min-heap whose priorities are computed by a function, so the whole queue
// can be re-evaluated with reprioritize(). Elements are unique by key.
template <typename T>
class PriorityQueue {
public:
    using PriorityFunction = std::function<double(const T&)>;
    using KeyFunction = std::function<std::string(const T&)>;

    // Priority that keeps an element out of the queue.
    static constexpr double DROP = std::numeric_limits<double>::infinity();

    PriorityQueue(PriorityFunction priorityFunction_, KeyFunction keyFunction_)
        : priorityFunction(std::move(priorityFunction_)),
          keyFunction(std::move(keyFunction_)) {}

    void clear() {
        elements.clear();
        priorities.clear();
        queuedElements.clear();
    }

    // Removes and returns the element with the lowest priority. Throws
    // MisuseException when empty.
    T dequeue() {
        if (elements.empty()) {
            throw MisuseException("Tried to dequeue from an empty queue");
        }
        T element = std::move(elements.front());
        if (elements.size() == 1) {
            elements.clear();
            priorities.clear();
        } else {
            elements.front() = std::move(elements.back());
            priorities.front() = priorities.back();
            elements.pop_back();
            priorities.pop_back();
            siftUp(0);
        }
        queuedElements.erase(keyFunction(element));
        return element;
    }

    // False when the element's priority is DROP or its key is queued already.
    bool enqueue(T element) {
        const std::string key = keyFunction(element);
        if (queuedElements.count(key)) {
            return false;
        }
        const double priority = priorityFunction(element);
        if (priority == DROP) {
            return false;
        }
        elements.push_back(std::move(element));
        priorities.push_back(priority);
        queuedElements.insert(key);
        siftDown(0, elements.size() - 1);
        return true;
    }

    std::size_t getCount() const { return elements.size(); }
    bool isEmpty() const { return elements.empty(); }
    bool isKeyQueued(const std::string& key) const { return queuedElements.count(key) > 0; }
    bool isQueued(const T& element) const { return isKeyQueued(keyFunction(element)); }

    // Recomputes every priority, dropping elements that now evaluate to DROP.
    void reprioritize() {
        std::size_t index = 0;
        for (std::size_t i = 0; i < elements.size(); ++i) {
            const double priority = priorityFunction(elements[i]);
            if (priority == DROP) {
                queuedElements.erase(keyFunction(elements[i]));
            } else {
                priorities[index] = priority;
                if (index != i) {
                    elements[index] = std::move(elements[i]);
                }
                ++index;
            }
        }
        elements.resize(index);
        priorities.resize(index);
        heapify();
    }

private:
    static std::size_t leftChild(std::size_t index) { return index * 2 + 1; }
    static std::size_t rightChild(std::size_t index) { return index * 2 + 2; }
    static std::size_t parent(std::size_t index) { return (index - 1) / 2; }

    void heapify() {
        for (std::size_t i = elements.size() / 2; i-- > 0;) {
            siftUp(i);
        }
    }

    // Moves the smaller child up until `index` is a leaf, then sifts the
    // element that was at `index` back down from there.
    void siftUp(std::size_t index) {
        const std::size_t count = elements.size();
        T element = std::move(elements[index]);
        const double priority = priorities[index];
        const std::size_t startIndex = index;

        while (index < count / 2) {
            const std::size_t left = leftChild(index);
            const std::size_t right = rightChild(index);
            const std::size_t smaller = right < count && priorities[right] < priorities[left] ? right : left;
            elements[index] = std::move(elements[smaller]);
            priorities[index] = priorities[smaller];
            index = smaller;
        }

        elements[index] = std::move(element);
        priorities[index] = priority;
        siftDown(startIndex, index);
    }

    void siftDown(std::size_t startIndex, std::size_t index) {
        T element = std::move(elements[index]);
        const double priority = priorities[index];

        while (index > startIndex) {
            const std::size_t parentIndex = parent(index);
            if (priorities[parentIndex] > priority) {
                elements[index] = std::move(elements[parentIndex]);
                priorities[index] = priorities[parentIndex];
                index = parentIndex;
            } else {
                break;
            }
        }

        elements[index] = std::move(element);
        priorities[index] = priority;
    }

    PriorityFunction priorityFunction;
    KeyFunction keyFunction;
    std::vector<T> elements;
    std::vector<double> priorities;
    std::unordered_set<std::string> queuedElements;
};

template <typename T>
constexpr double PriorityQueue<T>::DROP;

} // namespace util
} // namespace tessera

#endif
