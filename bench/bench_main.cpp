#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "core/diff_session.hpp"

namespace {

struct Fill {
    std::string cl_ord_id;
    std::string venue;
    long long qty{0};
    double px{0.0};
};

template <class In>
void introspect(In&& inspect, const Fill& f) {
    inspect(f.cl_ord_id, "ClOrdID");
    inspect(f.venue, "Venue");
    inspect(f.qty, "Qty");
    inspect(f.px, "Px");
}

std::string_view introspect_name(const Fill*) { return "Fill"; }

std::vector<Fill> make_fills(std::size_t n) {
    std::vector<Fill> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(Fill{"CID" + std::to_string(i), "XLON", static_cast<long long>(100 + i % 7),
                           1.0 + static_cast<double>(i % 13) / 100.0});
    }
    return out;
}

} // namespace

int main() {
    constexpr std::size_t fills = 10000;
    constexpr std::size_t iterations = 20;

    const auto a = make_fills(fills);
    auto b = a;
    for (std::size_t i = 0; i < fills; i += 97) {
        b[i].qty += 1;
    }

    std::size_t differences = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        core::DiffSession session;
        session.exclude({R"(\.Venue$)"}).compare(a, b);
        differences = session.size();
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Benchmark diff of " << fills << " records x " << iterations << " iterations took " << ns
              << " ns (" << (ns / iterations) << " ns/iter, " << differences << " differences)\n";
    return 0;
}
