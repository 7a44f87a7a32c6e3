#include "taskd/vocabulary.hpp"

#include <memory>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace taskd;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success and error", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(42);
  REQUIRE(ok.has_value());
  REQUIRE(ok.value() == 42);

  auto err = expected<int, ErrorCode>::error(ErrorCode::kQueueFull);
  REQUIRE_FALSE(err.has_value());
  REQUIRE(err.get_error() == ErrorCode::kQueueFull);
  REQUIRE(err.value_or(7) == 7);
}

TEST_CASE("expected - owns non-trivial values", "[vocabulary]") {
  auto original = expected<std::string, ErrorCode>::success(std::string(100, 'x'));
  auto copy = original;
  REQUIRE(copy.value().size() == 100);

  auto moved = std::move(original);
  REQUIRE(moved.value() == copy.value());

  std::string taken = std::move(moved).value();
  REQUIRE(taken.size() == 100);
}

TEST_CASE("expected - assignment switches between value and error", "[vocabulary]") {
  auto result = expected<std::string, ErrorCode>::error(ErrorCode::kMalformed);
  result = expected<std::string, ErrorCode>::success("digest");
  REQUIRE(result.has_value());
  REQUIRE(result.value() == "digest");

  result = expected<std::string, ErrorCode>::error(ErrorCode::kTimeout);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kTimeout);
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  auto ok = expected<void, ErrorCode>::success();
  REQUIRE(ok.has_value());

  auto err = expected<void, ErrorCode>::error(ErrorCode::kQueueClosed);
  REQUIRE_FALSE(err);
  REQUIRE(err.get_error() == ErrorCode::kQueueClosed);
}

TEST_CASE("ErrorCode - every code has a name", "[vocabulary]") {
  const ErrorCode codes[] = {
      ErrorCode::kOk,           ErrorCode::kFrameTooShort,    ErrorCode::kFrameTooLarge,
      ErrorCode::kMalformed,    ErrorCode::kTimeout,          ErrorCode::kConnectionClosed,
      ErrorCode::kSocketError,  ErrorCode::kQueueFull,        ErrorCode::kQueueClosed,
      ErrorCode::kInvalidState, ErrorCode::kMaxConnectionsExceeded, ErrorCode::kInvalidAddress,
      ErrorCode::kInternalError,
  };
  for (ErrorCode code : codes) {
    REQUIRE(std::string(error_code_name(code)) != "unknown");
  }
  REQUIRE(std::string(error_code_name(ErrorCode::kTimeout)) == "timeout");
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty and with value", "[vocabulary]") {
  optional<int> none;
  REQUIRE_FALSE(none.has_value());
  REQUIRE(none.value_or(5) == 5);

  optional<int> some(3);
  REQUIRE(some);
  REQUIRE(some.value() == 3);

  some.reset();
  REQUIRE_FALSE(some.has_value());
}

TEST_CASE("optional - holds move-only types", "[vocabulary]") {
  optional<std::unique_ptr<int>> slot;
  slot.emplace(new int(9));
  REQUIRE(*slot.value() == 9);

  optional<std::unique_ptr<int>> moved(std::move(slot));
  REQUIRE(moved.has_value());
  REQUIRE(*moved.value() == 9);
}

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

TEST_CASE("FixedVector - push until full", "[vocabulary]") {
  FixedVector<int, 3> vec;
  REQUIRE(vec.empty());
  REQUIRE(vec.push_back(1));
  REQUIRE(vec.push_back(2));
  REQUIRE(vec.push_back(3));
  REQUIRE(vec.full());
  REQUIRE_FALSE(vec.push_back(4));
  REQUIRE(vec.size() == 3);
  REQUIRE(vec.back() == 3);
}

TEST_CASE("FixedVector - erase_unordered swaps in the last element", "[vocabulary]") {
  FixedVector<std::shared_ptr<int>, 4> vec;
  for (int i = 0; i < 4; ++i) {
    REQUIRE(vec.push_back(std::make_shared<int>(i)));
  }

  vec.erase_unordered(1);
  REQUIRE(vec.size() == 3);
  REQUIRE(*vec[0] == 0);
  REQUIRE(*vec[1] == 3);
  REQUIRE(*vec[2] == 2);

  vec.erase_unordered(2);
  REQUIRE(vec.size() == 2);

  vec.erase_unordered(10);
  REQUIRE(vec.size() == 2);
}

TEST_CASE("FixedVector - clear releases elements", "[vocabulary]") {
  auto shared = std::make_shared<int>(1);
  {
    FixedVector<std::shared_ptr<int>, 4> vec;
    REQUIRE(vec.push_back(std::shared_ptr<int>(shared)));
    REQUIRE(shared.use_count() == 2);
    vec.clear();
    REQUIRE(shared.use_count() == 1);
    REQUIRE(vec.empty());
  }
}

TEST_CASE("kCacheLine constant", "[vocabulary]") {
  REQUIRE(kCacheLine == 64);
}
