// Automated tests for CaptureBuffer

#include "capture_buffer.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <vector>

using namespace voxpipe;

void test_reserve() {
    std::cout << "Testing capacity reservation..." << std::endl;

    CaptureBuffer buffer;
    buffer.open(48000, 2, 30);

    assert(buffer.is_open());
    assert(buffer.capacity() >= 48000u * 2 * 30);
    assert(buffer.size() == 0);
    assert(buffer.sample_rate() == 48000 && buffer.channels() == 2);

    std::cout << "  PASS: " << buffer.capacity() << " samples reserved" << std::endl;
}

void test_float_conversion() {
    std::cout << "Testing float to 16-bit conversion..." << std::endl;

    assert(CaptureBuffer::float_to_i16(0.0f) == 0);
    assert(CaptureBuffer::float_to_i16(1.0f) == 32767);
    assert(CaptureBuffer::float_to_i16(-1.0f) == -32767);
    assert(CaptureBuffer::float_to_i16(2.5f) == 32767 && "Clamped above");
    assert(CaptureBuffer::float_to_i16(-7.0f) == -32767 && "Clamped below");
    assert(CaptureBuffer::float_to_i16(0.5f) == 16383);

    std::cout << "  PASS: Clamped and scaled" << std::endl;
}

void test_append_and_take() {
    std::cout << "Testing append and take..." << std::endl;

    CaptureBuffer buffer;

    // Closed buffers drop writes
    int16_t early[] = {1, 2, 3};
    buffer.append(early, 3);
    assert(buffer.size() == 0);

    buffer.open(16000, 1, 1);
    buffer.append(early, 3);
    float loud[] = {1.0f, -1.0f};
    buffer.append_float(loud, 2);
    assert(buffer.size() == 5);

    buffer.close();
    buffer.append(early, 3);
    assert(buffer.size() == 5 && "Writes after close are dropped");

    std::vector<int16_t> taken = buffer.take();
    assert((taken == std::vector<int16_t>{1, 2, 3, 32767, -32767}));
    assert(buffer.size() == 0 && "Take leaves the buffer empty");

    std::cout << "  PASS: Ownership moved to the reader" << std::endl;
}

// Writes past max_seconds are dropped instead of growing the buffer
void test_limit() {
    std::cout << "Testing capture limit..." << std::endl;

    CaptureBuffer buffer;
    buffer.open(1000, 2, 1);
    assert(buffer.limit() == 2000);
    const size_t reserved = buffer.capacity();

    std::vector<int16_t> chunk(1500, 7);
    buffer.append(chunk.data(), chunk.size());
    std::vector<float> more(1000, 0.5f);
    buffer.append_float(more.data(), more.size());
    buffer.append(chunk.data(), chunk.size());

    assert(buffer.size() == buffer.limit() && "Buffer stops at the limit");
    assert(buffer.capacity() == reserved && "No reallocation past the reservation");
    assert(buffer.dropped() == 500 + 1500);

    auto taken = buffer.take();
    assert(taken[1499] == 7 && taken[1500] == CaptureBuffer::float_to_i16(0.5f));

    // Reopening starts a fresh count
    buffer.open(1000, 1, 1);
    assert(buffer.dropped() == 0 && buffer.limit() == 1000);

    std::cout << "  PASS: " << taken.size() << " kept, 2000 dropped" << std::endl;
}

void test_concurrent_producer() {
    std::cout << "Testing producer/consumer handoff..." << std::endl;

    CaptureBuffer buffer;
    buffer.open(16000, 1, 2);

    std::vector<float> chunk(512, 0.25f);
    std::thread producer([&]() {
        for (int i = 0; i < 50; ++i) {
            buffer.append_float(chunk.data(), chunk.size());
        }
    });
    producer.join();

    buffer.close();
    auto taken = buffer.take();
    assert(taken.size() == 50 * 512);
    for (int16_t s : taken) assert(s == CaptureBuffer::float_to_i16(0.25f));

    std::cout << "  PASS: " << taken.size() << " samples handed over" << std::endl;
}

int main() {
    std::cout << "\n=== Capture Buffer Test Suite ===" << std::endl << std::endl;

    test_reserve();
    test_float_conversion();
    test_append_and_take();
    test_limit();
    test_concurrent_producer();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
