#pragma once

#include "util.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace vheap {

// Snapshot of a single event attribute. Items are rendered as strings
// unless they are plain numbers or booleans.
using Value = std::variant<std::int64_t, double, bool, std::string>;

struct Attribute {
    std::string name;
    Value value;
};

using Attributes = std::vector<Attribute>;

inline std::ostream &print(std::ostream &os, const Value &v) {
    std::visit([&os](const auto &x) { os << std::boolalpha << x; }, v);
    return os;
}

inline std::string toString(const Value &v) {
    std::ostringstream os;
    print(os, v);
    return os.str();
}

//! Returns the attribute named name, or nullptr.
inline const Value *find(const Attributes &attrs, std::string_view name) {
    for (const auto &a : attrs) {
        if (a.name == name) return &a.value;
    }
    return nullptr;
}

/**
 * Receives the structural events of a heap synchronously, in program order.
 *
 * Handlers run in the middle of a mutation: they may read the heap but any
 * mutating call is rejected with ReentrantMutation. Anything a handler throws
 * is swallowed by the heap.
 */
class Observer {
public:
    virtual ~Observer() = default;

    virtual void onEvent(std::string_view event, const Attributes &attrs) = 0;
};

class CallbackObserver : public Observer {
public:
    using Callback = std::function<void(std::string_view, const Attributes &)>;

    explicit CallbackObserver(Callback cb) : cb_(std::move(cb)) {}

    void onEvent(std::string_view event, const Attributes &attrs) override {
        if (cb_) cb_(event, attrs);
    }

private:
    Callback cb_;
};

//! Writes one "event=<name> key=value ..." line per event.
class StreamObserver : public Observer {
public:
    explicit StreamObserver(std::ostream &os) : os_(os) {}

    void onEvent(std::string_view event, const Attributes &attrs) override {
        os_ << "event=" << event;
        for (const auto &a : attrs) {
            os_ << " " << a.name << "=";
            print(os_, a.value);
        }
        os_ << "\n";
    }

private:
    std::ostream &os_;
};

namespace detail {

template <class T>
struct Arg {
    const char *name;
    const T &value;
};

template <class T>
Arg<T> arg(const char *name, const T &value) {
    return {name, value};
}

/**
 * Dispatches events to the registered observer. Attributes are only
 * rendered when someone is listening.
 */
template <class Cfg>
class Notifier {
public:
    explicit Notifier(Observer *observer = nullptr) : observer_(observer) {}

    Observer *observer() const { return observer_; }
    void setObserver(Observer *observer) { observer_ = observer; }

    template <class... Ts>
    void operator()(std::string_view event, const Arg<Ts> &...args) const {
        if (observer_ == nullptr) return;

        try {
            Attributes attrs;
            attrs.reserve(sizeof...(Ts));
            (attrs.push_back({args.name, snapshot(args.value)}), ...);
            observer_->onEvent(event, attrs);
        } catch (const std::exception &e) {
            VHEAP_TRACE << "event=observer_error on=" << event
                        << " what=" << e.what() << "\n";
        } catch (...) {
            VHEAP_TRACE << "event=observer_error on=" << event
                        << " what=unknown\n";
        }
    }

private:
    template <class T>
    static Value snapshot(const T &v) {
        if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<std::int64_t>(v);
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<double>(v);
        } else {
            return repr(v, Cfg::kMaxReprLength);
        }
    }

    Observer *observer_;
};

} // namespace detail

} // namespace vheap
