#include <catch2/catch_test_macros.hpp>
#include <pitwall/sequence_guard.hpp>

using namespace pitwall;

TEST_CASE("sequence guard accepts increasing sequences with gaps") {
  SequenceGuard g;
  REQUIRE(g.check(1, 10) == SeqVerdict::Accepted);
  REQUIRE(g.check(1, 11) == SeqVerdict::Accepted);
  REQUIRE(g.check(1, 15) == SeqVerdict::Accepted); // lost 12..14
  std::uint32_t last = 0;
  REQUIRE(g.last(1, last));
  REQUIRE(last == 15);
  REQUIRE(g.accepted() == 3);
}

TEST_CASE("sequence guard discards duplicates and stale arrivals") {
  SequenceGuard g;
  REQUIRE(g.check(7, 100) == SeqVerdict::Accepted);
  REQUIRE(g.check(7, 100) == SeqVerdict::Duplicate);
  REQUIRE(g.check(7, 99) == SeqVerdict::OutOfOrder);
  REQUIRE(g.check(7, 101) == SeqVerdict::Accepted);
  REQUIRE(g.accepted() == 2);
}

TEST_CASE("sequence guard tracks cars independently") {
  SequenceGuard g;
  REQUIRE(g.check(1, 50) == SeqVerdict::Accepted);
  REQUIRE(g.check(2, 1) == SeqVerdict::Accepted);
  REQUIRE(g.check(2, 0) == SeqVerdict::OutOfOrder);
  REQUIRE(g.check(65535, 0) == SeqVerdict::Accepted);

  std::uint32_t last = 0;
  REQUIRE_FALSE(g.last(3, last));

  g.reset();
  REQUIRE_FALSE(g.last(1, last));
  REQUIRE(g.check(1, 0) == SeqVerdict::Accepted);
}
