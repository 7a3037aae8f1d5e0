#include "feed/BoundedTickQueue.h"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using tickpilot::Tick;
using tickpilot::fromEpochMs;
using tickpilot::feed::BoundedTickQueue;

namespace {
Tick tickAt(double price, long long ts_ms) {
    return Tick("TEST", fromEpochMs(ts_ms), price);
}
}

int main() {
    // capacity 3, T1..T5 pushed: consumer sees T3, T4, T5
    {
        BoundedTickQueue queue(3);
        for (int i = 1; i <= 5; ++i) {
            const bool evicted = queue.push(tickAt(100.0 + i, 1000 + i));
            assert(evicted == (i > 3));
        }
        assert(queue.size() == 3);
        assert(queue.evictedCount() == 2);

        auto t3 = queue.tryPop();
        auto t4 = queue.tryPop();
        auto t5 = queue.tryPop();
        assert(t3 && *t3->price() == 103.0);
        assert(t4 && *t4->price() == 104.0);
        assert(t5 && *t5->price() == 105.0);
        assert(!queue.tryPop());
    }

    // empty pop is not an error and the queue stays usable
    {
        BoundedTickQueue queue(2);
        assert(!queue.tryPop());
        queue.push(tickAt(1.0, 1));
        assert(queue.size() == 1);
        queue.clear();
        assert(queue.size() == 0);
        assert(queue.capacity() == 2);
    }

    {
        bool threw = false;
        try {
            BoundedTickQueue queue(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // producer never blocks; consumer sees increasing order, newest always last
    {
        BoundedTickQueue queue(16);
        constexpr int kTotal = 20000;
        std::atomic<bool> done{false};
        std::vector<double> seen;

        std::thread consumer([&] {
            while (!done.load() || queue.size() > 0) {
                if (auto t = queue.tryPop()) {
                    seen.push_back(*t->price());
                }
            }
        });

        for (int i = 1; i <= kTotal; ++i) {
            queue.push(tickAt(static_cast<double>(i), i));
        }
        done = true;
        consumer.join();

        assert(!seen.empty());
        for (std::size_t i = 1; i < seen.size(); ++i) {
            assert(seen[i] > seen[i - 1]);
        }
        assert(seen.back() == static_cast<double>(kTotal));
        assert(seen.size() + queue.evictedCount() == static_cast<std::size_t>(kTotal));
    }

    std::cout << "[TEST] BoundedTickQueue PASSED\n";
    return 0;
}
