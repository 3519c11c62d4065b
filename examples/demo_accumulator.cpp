#include <streamavg/accumulator.hpp>
#include <iostream>

int main() {
  auto acc = streamavg::Accumulator<int>::with_threshold(6.0);
  const int values[] = {2, 4, 4, 7, 3, 9, 12, 15, 4};

  for (int v : values) {
    const auto result = acc.add_with_result(v);
    if (!result) {
      std::cout << "stopped after " << v << ": " << result.error.message() << "\n";
      break;
    }
  }

  std::cout << "n=" << acc.count()
            << " mean=" << acc
            << " mode=" << acc.mode()
            << "\n";
}
