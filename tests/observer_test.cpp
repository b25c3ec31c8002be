#include <vheap/vheap.hpp>

#include <range/v3/core.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <tlx/die.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct IntCfg : vheap::DefaultCfg {
    using Item = int;
};

struct TextCfg : vheap::DefaultCfg {
    using Item = std::string;
    static constexpr std::size_t kMaxReprLength = 8;
};

using IntHeap = vheap::Heap<IntCfg>;
using Ints = std::vector<int>;
using Names = std::vector<std::string>;

struct Event {
    std::string name;
    vheap::Attributes attrs;

    std::int64_t integer(std::string_view key) const {
        const auto *v = vheap::find(attrs, key);
        die_unless(v != nullptr);
        return std::get<std::int64_t>(*v);
    }

    std::string text(std::string_view key) const {
        const auto *v = vheap::find(attrs, key);
        die_unless(v != nullptr);
        return std::get<std::string>(*v);
    }
};

// Records every event it sees
class Recorder : public vheap::Observer {
public:
    void onEvent(std::string_view event,
                 const vheap::Attributes &attrs) override {
        events.push_back({std::string(event), attrs});
    }

    Names names() const {
        return events |
               ranges::views::transform([](const Event &e) { return e.name; }) |
               ranges::to<Names>();
    }

    bool seen(std::string_view name) const {
        const auto names = this->names();
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    const Event &last(std::string_view name) const {
        auto it = std::find_if(events.rbegin(), events.rend(),
                               [name](const Event &e) { return e.name == name; });
        die_unless(it != events.rend());
        return *it;
    }

    std::vector<Event> events;
};

int main() {
    { // a push that climbs reports compare and swap for each step
        Recorder rec;
        IntHeap heap{vheap::Options{vheap::Mode::Min, vheap::NanPolicy::Raise,
                                    0, &rec}};
        heap.push(5);
        die_unless((rec.names() == Names{"insert_start", "insert", "push_done"}));

        rec.events.clear();
        heap.push(1);
        die_unless((rec.names() == Names{"insert_start", "insert", "compare",
                                         "swap", "push_done"}));

        const auto &insert = rec.events[1];
        die_unequal(insert.integer("index"), 1);
        die_unequal(insert.integer("value"), 1);

        const auto &swap = rec.events[3];
        die_unequal(swap.integer("i"), 1);
        die_unequal(swap.integer("j"), 0);
        die_unequal(swap.integer("ai"), 1);
        die_unequal(swap.integer("aj"), 5);
        die_unequal(rec.events[4].integer("size"), 2);
    }

    { // pop reports the root, the move of the last element and the sift
        Recorder rec;
        IntHeap heap;
        for (int v : {1, 3, 8}) heap.push(v);
        heap.setObserver(&rec);

        die_unequal(*heap.pop(), 1);
        die_unless((rec.names() == Names{"pop_start", "pop_root", "move",
                                         "compare", "swap", "pop_done"}));
        const auto &move = rec.events[2];
        die_unequal(move.integer("src"), 2);
        die_unequal(move.integer("dst"), 0);
        die_unequal(move.integer("value"), 8);
        die_unequal(rec.events[5].integer("value"), 1);
        die_unequal(rec.events[5].integer("size"), 2);

        rec.events.clear();
        heap.clear();
        heap.pop();
        die_unless((rec.names() == Names{"clear", "pop_empty"}));
        die_unequal(rec.events[0].integer("count"), 2);
    }

    { // the remaining operations announce themselves
        Recorder rec;
        IntHeap heap{Ints{4, 2, 6, 2}, vheap::Options{vheap::Mode::Min,
                                                    vheap::NanPolicy::Raise, 0,
                                                    &rec}};
        die_unless(rec.seen("heapify_done"));

        heap.extend(Ints{9, 7});
        die_unequal(rec.last("extend").integer("added"), 2);

        heap.toggleMode();
        die_unequal(rec.last("toggle_mode").text("mode"), std::string("max"));

        heap.setMode(vheap::Mode::Min);
        die_unequal(rec.last("set_mode").text("mode"), std::string("min"));

        heap.remove(2, true);
        die_unequal(rec.last("remove_value").integer("count"), 2);
        die_unequal(rec.last("remove_value").integer("value"), 2);
        die_unless(rec.seen("remove_at"));

        heap.replace(5);
        die_unequal(rec.last("replace_root").integer("value"), 5);
        die_unequal(rec.last("replace_root").integer("old"), 4);

        rec.events.clear();
        die_unequal(heap.pushPop(1), 1);
        die_unless(!rec.seen("replace_root"));

        heap.merge(IntHeap{Ints{3}});
        die_unequal(rec.last("merge").integer("added"), 1);

        heap.heapify();
        die_unless(rec.seen("heapify_done"));
    }

    { // long values are cut down before they reach the observer
        Recorder rec;
        vheap::Heap<TextCfg> heap{vheap::Options{
            vheap::Mode::Min, vheap::NanPolicy::Raise, 0, &rec}};
        heap.push("abc");
        heap.push("abcdefghijklmnop");
        die_unequal(rec.last("insert").text("value"),
                    std::string("abcdefgh…"));
        die_unequal(rec.events.front().text("value"), std::string("abc"));
    }

    { // truncation never splits a multi-byte character
        Recorder rec;
        vheap::Heap<TextCfg> heap{vheap::Options{
            vheap::Mode::Max, vheap::NanPolicy::Raise, 0, &rec}};
        heap.push("abcdefg\xC3\xA9xyz");
        die_unequal(rec.last("insert").text("value"),
                    std::string("abcdefg…"));
        heap.push("abcdef\xE2\x82\xACz");
        die_unequal(rec.last("insert").text("value"),
                    std::string("abcdef…"));
        heap.push("abcdefgh\xC3\xA9");
        die_unequal(rec.last("insert").text("value"),
                    std::string("abcdefgh…"));
    }

    { // a failing observer cannot break an operation
        vheap::CallbackObserver angry(
            [](std::string_view, const vheap::Attributes &) {
                throw std::runtime_error("observer is upset");
            });
        IntHeap heap{vheap::Options{vheap::Mode::Max, vheap::NanPolicy::Raise,
                                    1, &angry}};
        heap.extend(Ints{3, 9, 1, 7});
        heap.push(8);
        die_unequal(*heap.pop(), 9);
        die_unequal(heap.remove(1), std::size_t{1});
        die_unless(heap.isValidHeap());
        die_unequal(heap.size(), std::size_t{3});
    }

    { // whatever an observer throws, the operation completes
        vheap::CallbackObserver hostile(
            [](std::string_view event, const vheap::Attributes &) {
                if (event == "clear" || event == "swap") throw 42;
            });
        IntHeap heap{Ints{4, 6, 8, 7}};
        heap.setObserver(&hostile);

        heap.push(1);
        die_unless((heap.toVector() == Ints{1, 4, 8, 7, 6}));
        die_unequal(*heap.pop(), 1);
        die_unequal(*heap.pop(), 4);
        die_unless(heap.isValidHeap());

        heap.clear();
        die_unless(heap.empty());
        die_unequal(heap.operations(), 5u);
    }

    { // an observer that mutates the heap is turned away
        IntHeap heap{Ints{2, 4, 6}};
        int rejected = 0;
        vheap::CallbackObserver meddler(
            [&heap, &rejected](std::string_view event,
                               const vheap::Attributes &) {
                if (event != "compare") return;
                try {
                    heap.push(100);
                } catch (const vheap::ReentrantMutation &) {
                    ++rejected;
                }
            });
        heap.setObserver(&meddler);

        const auto ops = heap.operations();
        heap.push(1);
        die_unless(rejected > 0);
        die_unequal(heap.operations(), ops + 1);
        die_unless(heap.isValidHeap());
        die_unless((heap.drain() == Ints{1, 2, 4, 6}));
    }

    { // rejection propagating out of the observer is swallowed as well
        IntHeap heap{Ints{2, 4, 6}};
        vheap::CallbackObserver meddler(
            [&heap](std::string_view event, const vheap::Attributes &) {
                if (event == "compare") heap.pop();
            });
        heap.setObserver(&meddler);
        heap.push(1);
        heap.setObserver(nullptr);
        die_unless((heap.drain() == Ints{1, 2, 4, 6}));
    }

    { // reading the heap from inside a handler is fine
        IntHeap heap;
        std::size_t largest_seen = 0;
        vheap::CallbackObserver reader(
            [&heap, &largest_seen](std::string_view, const vheap::Attributes &) {
                largest_seen = std::max(largest_seen, heap.size());
                die_unless(heap.peek().has_value() || heap.empty());
            });
        heap.setObserver(&reader);
        heap.extend(Ints{5, 3, 1});
        die_unequal(largest_seen, std::size_t{3});
    }

    { // the stream observer writes one line per event
        std::ostringstream os;
        vheap::StreamObserver printer(os);
        IntHeap heap{vheap::Options{vheap::Mode::Min, vheap::NanPolicy::Raise,
                                    0, &printer}};
        heap.push(2);
        heap.push(1);
        const std::string expected = "event=insert_start value=2\n"
                                     "event=insert index=0 value=2\n"
                                     "event=push_done size=1\n"
                                     "event=insert_start value=1\n"
                                     "event=insert index=1 value=1\n"
                                     "event=compare i=1 j=0 ai=1 aj=2\n"
                                     "event=swap i=1 j=0 ai=1 aj=2\n"
                                     "event=push_done size=2\n";
        die_unequal(os.str(), expected);

        // copies and detached heaps stay quiet
        IntHeap copy = heap;
        copy.push(0);
        heap.setObserver(nullptr);
        heap.push(0);
        die_unequal(os.str(), expected);
    }
}
