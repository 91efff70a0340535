#pragma once

#include <algorithm>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vl::concurrency {

// Ordered, id-addressable registry. T must expose `const std::string& id() const`.
template <typename T>
class Queue {
public:
    using Item = std::shared_ptr<T>;

    void enqueue(Item item) { items_.push_back(std::move(item)); }

    // Prepends; used to give an item priority over everything already queued.
    void unshift(Item item) { items_.push_front(std::move(item)); }

    Item dequeue() {
        if (items_.empty()) throw std::out_of_range("Queue::dequeue on empty queue");
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    [[nodiscard]] Item find(const std::string& id) const {
        const auto it = locate(id);
        return it == items_.end() ? nullptr : *it;
    }

    Item remove(const std::string& id) {
        const auto it = locate(id);
        if (it == items_.end()) return nullptr;
        auto item = std::move(*it);
        items_.erase(it);
        return item;
    }

    [[nodiscard]] bool contains(const std::string& id) const { return locate(id) != items_.end(); }
    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    // Leaves the items themselves untouched.
    void clear() { items_.clear(); }

    [[nodiscard]] std::vector<Item> list() const { return {items_.begin(), items_.end()}; }

private:
    std::deque<Item> items_;

    typename std::deque<Item>::const_iterator locate(const std::string& id) const {
        return std::ranges::find_if(items_, [&](const Item& item) { return item->id() == id; });
    }
};

}
