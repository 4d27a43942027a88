#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "core/canonical.hpp"
#include "core/comparator.hpp"
#include "core/value.hpp"

namespace {

// {"0": [], "1": [1], "2": [2, 2], ...}
core::Value make_payload(std::int64_t n) {
    core::Value v = core::Value::empty_mapping();
    for (std::int64_t i = 0; i < n; ++i) {
        core::Value items = core::Value::empty_sequence();
        for (std::int64_t k = 0; k < i; ++k) {
            items.push(core::Value::from_int(i));
        }
        v.set(std::to_string(i), std::move(items));
    }
    return v;
}

void run(std::int64_t n, std::size_t iterations) {
    const core::Value payload = make_payload(n);
    std::string canonical;
    core::EngineError err;
    if (!core::canonicalize(payload, core::Format::Json, canonical, err)) {
        std::cerr << "canonicalize failed: " << err.describe() << "\n";
        return;
    }
    core::AcceptedSnapshot stored;
    stored.body = canonical;
    const std::optional<core::AcceptedSnapshot> accepted(stored);

    std::size_t passes = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        std::string out;
        if (!core::canonicalize(payload, core::Format::Json, out, err)) {
            break;
        }
        passes += core::compare(out, accepted).is_pass() ? 1 : 0;
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "n=" << n << " (" << canonical.size() << " bytes): " << iterations << " iterations took " << ns
              << " ns (" << (ns / static_cast<long long>(iterations)) << " ns/iter, " << passes << " pass)\n";
}

} // namespace

int main() {
    run(10, 10000);
    run(1000, 5);
    return 0;
}
