//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/generator.hpp"

#include "ingest/test/test.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace ingest;

namespace {

auto iota(int n, int* resumed) -> generator<int> {
  for (auto i = 0; i < n; ++i) {
    ++*resumed;
    co_yield i;
  }
}

auto failing() -> generator<std::string> {
  co_yield "first";
  throw std::runtime_error{"boom"};
}

} // namespace

TEST("generator is lazy") {
  auto resumed = 0;
  auto xs = iota(3, &resumed);
  CHECK_EQUAL(resumed, 0);
  auto result = std::vector<int>{};
  for (auto x : xs) {
    result.push_back(x);
    CHECK_EQUAL(resumed, x + 1);
  }
  auto expected = std::vector<int>{0, 1, 2};
  CHECK_EQUAL(result, expected);
}

TEST("generator stops early") {
  auto resumed = 0;
  for (auto x : iota(100, &resumed)) {
    if (x == 4) {
      break;
    }
  }
  CHECK_EQUAL(resumed, 5);
}

TEST("generator propagates exceptions") {
  auto xs = failing();
  auto it = xs.begin();
  REQUIRE(it != xs.end());
  CHECK_EQUAL(*it, "first");
  auto caught = std::string{};
  try {
    ++it;
  } catch (const std::runtime_error& err) {
    caught = err.what();
  }
  CHECK_EQUAL(caught, "boom");
}

TEST("generator moves") {
  auto resumed = 0;
  auto xs = iota(2, &resumed);
  auto ys = std::move(xs);
  auto count = 0;
  for (auto y : ys) {
    count += y + 1;
  }
  CHECK_EQUAL(count, 3);
}
