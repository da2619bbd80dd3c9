/**
 * Test concurrent use of GF(256) arithmetic
 *
 * Many threads start at the same moment, each reaching the tables for the
 * first time in the process, and compute full multiplication / division /
 * inverse tables. Every thread must agree with the single-threaded reference.
 */

#include "field/field_element.h"
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace gf256;
using namespace gf256::field;

namespace {

struct OperationTable {
    std::vector<uint8_t> products;
    std::vector<uint8_t> quotients;
    std::vector<uint8_t> inverses;
    size_t division_errors = 0;
};

OperationTable computeOperationTable() {
    OperationTable table;
    table.products.reserve(FIELD_SIZE * FIELD_SIZE);
    table.quotients.reserve(FIELD_SIZE * FIELD_SIZE);
    table.inverses.reserve(FIELD_SIZE);

    for (uint16_t x = 0; x < FIELD_SIZE; ++x) {
        FieldElement a = FieldElement::fromByte(static_cast<uint8_t>(x));
        auto i = a.inv();
        table.inverses.push_back(i ? i->toByte() : 0);

        for (uint16_t y = 0; y < FIELD_SIZE; ++y) {
            FieldElement b = FieldElement::fromByte(static_cast<uint8_t>(y));
            table.products.push_back((a * b).toByte());
            try {
                table.quotients.push_back((a / b).toByte());
            } catch (const DivisionByZeroError&) {
                table.division_errors++;
                table.quotients.push_back(0);
            }
        }
    }
    return table;
}

} // namespace

int main() {
    std::cout << "=== GF(256) Concurrency Test ===\n\n";

    unsigned int thread_count = std::thread::hardware_concurrency();
    if (thread_count < 4) thread_count = 4;
    if (thread_count > 16) thread_count = 16;

    std::atomic<bool> start{false};
    std::vector<OperationTable> results(thread_count);
    std::vector<std::thread> threads;

    std::cout << "Starting " << thread_count << " threads...\n";
    for (unsigned int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&start, &results, t]() {
            while (!start.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            results[t] = computeOperationTable();
        });
    }
    start.store(true, std::memory_order_release);

    for (auto& thread : threads) {
        thread.join();
    }

    OperationTable reference = computeOperationTable();

    int failures = 0;
    for (unsigned int t = 0; t < thread_count; ++t) {
        bool ok = results[t].products == reference.products &&
                  results[t].quotients == reference.quotients &&
                  results[t].inverses == reference.inverses &&
                  results[t].division_errors == FIELD_SIZE;
        std::cout << "  Thread " << t << ": " << (ok ? "matches reference ✅" : "MISMATCH ❌") << "\n";
        if (!ok) failures++;
    }

    bool reference_ok = reference.division_errors == FIELD_SIZE;
    std::cout << "  Reference: " << reference.division_errors << " division-by-zero errors"
              << (reference_ok ? " ✅" : " ❌") << "\n";
    if (!reference_ok) failures++;

    std::cout << "\n" << (failures == 0 ? "All concurrency tests passed ✅" : "Concurrency tests FAILED ❌") << "\n";
    return failures == 0 ? 0 : 1;
}
