//=============================================================================
// CoalescingSlot Tests
//=============================================================================

#include <boost/ut.hpp>
#include <lazybar/coalescing-slot.h>
#include <thread>
#include <vector>

using namespace boost::ut;
using namespace lazybar;

suite coalescing_slot_tests = [] {
    "take returns the newest value"_test = [] {
        CoalescingSlot<int> slot;
        expect(slot.put(1)) << "first put signals a wake-up";
        expect(!slot.put(2));
        expect(!slot.put(3));

        auto v = slot.take();
        expect(v.has_value() && *v == 3);
        expect(!slot.take().has_value());
        expect(slot.superseded() == 2_u);
        expect(slot.puts() == 3_u);
    };

    "put after take signals again"_test = [] {
        CoalescingSlot<int> slot;
        slot.put(1);
        slot.take();
        expect(slot.put(2));
        expect(slot.pending());
    };

    "consumer sees an increasing subsequence ending in the last value"_test = [] {
        CoalescingSlot<int> slot;
        constexpr int N = 20000;

        std::thread producer([&] {
            for (int i = 1; i <= N; ++i) {
                slot.put(i);
            }
        });

        std::vector<int> seen;
        while (seen.empty() || seen.back() != N) {
            if (auto v = slot.take()) {
                seen.push_back(*v);
            } else {
                std::this_thread::yield();
            }
        }
        producer.join();

        bool increasing = true;
        for (size_t i = 1; i < seen.size(); ++i) {
            if (seen[i] <= seen[i - 1]) increasing = false;
        }
        expect(increasing);
        expect(seen.back() == N);
        expect(slot.puts() == uint64_t(N));
        expect(slot.superseded() + seen.size() == uint64_t(N));
    };
};
