// Automated tests for PermitPool

#include "permit_pool.hpp"
#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using namespace voxpipe;
using namespace std::chrono_literals;

void test_acquire_release() {
    std::cout << "Testing acquire and release..." << std::endl;

    PermitPool pool(2);
    assert(pool.total() == 2);
    assert(pool.available() == 2);

    {
        PermitPool::Permit a = pool.acquire();
        assert(a.valid());
        assert(pool.available() == 1);

        PermitPool::Permit b = pool.acquire();
        assert(pool.available() == 0);

        b.release();
        assert(!b.valid());
        assert(pool.available() == 1);
        b.release();  // second release is a no-op
        assert(pool.available() == 1);
    }
    assert(pool.available() == 2 && "Scope exit returns the permit");

    std::cout << "  PASS: Permits returned on every path" << std::endl;
}

void test_move() {
    std::cout << "Testing permit moves..." << std::endl;

    PermitPool pool(1);
    PermitPool::Permit a = pool.acquire();
    PermitPool::Permit b = std::move(a);
    assert(!a.valid());
    assert(b.valid());
    assert(pool.available() == 0);

    PermitPool::Permit c;
    c = std::move(b);
    assert(pool.available() == 0 && "Moving must not release");
    c = PermitPool::Permit();
    assert(pool.available() == 1 && "Overwriting releases the held permit");

    std::cout << "  PASS: Ownership transfers" << std::endl;
}

void test_zero_size() {
    std::cout << "Testing zero-size pool..." << std::endl;

    PermitPool pool(0);
    assert(pool.total() == 1 && "Pool always admits one");

    std::cout << "  PASS" << std::endl;
}

void test_bound() {
    std::cout << "Testing concurrency bound..." << std::endl;

    PermitPool pool(3);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            PermitPool::Permit permit = pool.acquire();
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(20ms);
            --active;
        });
    }
    for (auto& t : threads) t.join();

    assert(peak.load() <= 3);
    assert(peak.load() >= 1);
    assert(pool.available() == 3);

    std::cout << "  PASS: Peak concurrency " << peak.load() << std::endl;
}

int main() {
    std::cout << "\n=== Permit Pool Test Suite ===" << std::endl << std::endl;

    test_acquire_release();
    test_move();
    test_zero_size();
    test_bound();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
