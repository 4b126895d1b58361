#include "event.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("push triggers a deploy", "[event]") {
  REQUIRE(awd::classify_event(std::string("push")) == awd::EventAction::Deploy);
}

TEST_CASE("other events are ignored", "[event]") {
  REQUIRE(awd::classify_event(std::string("ping")) == awd::EventAction::Ignore);
  REQUIRE(awd::classify_event(std::string("pull_request")) ==
          awd::EventAction::Ignore);
  REQUIRE(awd::classify_event(std::nullopt) == awd::EventAction::Ignore);
  REQUIRE(awd::classify_event(std::string{}) == awd::EventAction::Ignore);
}

TEST_CASE("event matching is exact", "[event]") {
  REQUIRE(awd::classify_event(std::string("Push")) == awd::EventAction::Ignore);
  REQUIRE(awd::classify_event(std::string("PUSH")) == awd::EventAction::Ignore);
  REQUIRE(awd::classify_event(std::string(" push")) ==
          awd::EventAction::Ignore);
  REQUIRE(awd::classify_event(std::string("push ")) ==
          awd::EventAction::Ignore);
}
