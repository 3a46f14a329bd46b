#ifndef LANCHAT_OBSERVER_LIST_HPP
#define LANCHAT_OBSERVER_LIST_HPP

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <vector>

// Non-owning list of observers, notified in registration order.
// notify() works on a snapshot, so observers may register or unregister
// from inside a callback. remove() does not wait for a notification already
// running on another thread.
template <typename Observer>
class ObserverList {
public:
    bool add(Observer* observer) {
        if (!observer) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) {
            return false;
        }
        observers_.push_back(observer);
        return true;
    }

    bool remove(Observer* observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(observers_.begin(), observers_.end(), observer);
        if (it == observers_.end()) return false;
        observers_.erase(it);
        return true;
    }

    template <typename Fn>
    void notify(Fn&& fn) const {
        std::vector<Observer*> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = observers_;
        }
        for (Observer* observer : snapshot) {
            fn(*observer);
        }
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return observers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Observer*> observers_;
};

#endif // LANCHAT_OBSERVER_LIST_HPP
