#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "osb/events/command_parser.hpp"
#include "osb/events/command_tree.hpp"

using namespace osb::events;
using osb::core::Error;
using osb::core::ErrorCode;

namespace {

Command Line(const std::string& text) {
  Command command;
  Error error;
  REQUIRE(ParseCommand(text, &command, &error));
  return command;
}

}  // namespace

TEST_CASE("Builder nests commands under containers", "[tree]") {
  std::vector<Command> root;
  CommandTreeBuilder builder(&root);
  Error error;

  REQUIRE(builder.Push(Line("F,0,0,100,1"), 1, &error));
  REQUIRE(builder.Push(Line("L,0,3"), 1, &error));
  REQUIRE(builder.Push(Line("M,0,0,100,1,2"), 2, &error));
  REQUIRE(builder.Push(Line("T,Passing,0,100"), 2, &error));
  REQUIRE(builder.Push(Line("S,0,0,100,1"), 3, &error));
  REQUIRE(builder.depth() == 3);
  REQUIRE(builder.Push(Line("R,0,0,100,1"), 1, &error));
  REQUIRE(builder.depth() == 1);

  REQUIRE(root.size() == 3);
  const auto& loop = std::get<Loop>(root[1].properties);
  REQUIRE(loop.commands.size() == 2);
  REQUIRE(loop.commands[1].children()->size() == 1);
  REQUIRE(CountCommands(root) == 6);

  const auto lines = FlattenCommands(root);
  REQUIRE(lines.has_value());
  REQUIRE(*lines == std::vector<std::string>{" F,0,0,100,1", " L,0,3", "  M,0,0,100,1,2", "  T,Passing,0,100",
                                             "   S,0,0,100,1", " R,0,0,100,1"});
}

TEST_CASE("Builder rejects bad indentation", "[tree][error]") {
  std::vector<Command> root;
  CommandTreeBuilder builder(&root);
  Error error;

  SECTION("first command too deep") {
    REQUIRE_FALSE(builder.Push(Line("F,0,0,100,1"), 2, &error));
    REQUIRE(error.code == ErrorCode::kInvalidIndentation);
    REQUIRE(error.Message() == "Invalid indentation, expected 1, got 2");
  }

  SECTION("deeper line after a non-container") {
    REQUIRE(builder.Push(Line("F,0,0,100,1"), 1, &error));
    REQUIRE_FALSE(builder.Push(Line("F,0,0,100,1"), 2, &error));
    REQUIRE(error.Message() == "Invalid indentation, expected 1, got 2");
  }

  SECTION("skipping a level after a container") {
    REQUIRE(builder.Push(Line("L,0,3"), 1, &error));
    REQUIRE_FALSE(builder.Push(Line("F,0,0,100,1"), 3, &error));
    REQUIRE(error.Message() == "Invalid indentation, expected 2, got 3");
  }

  SECTION("depth zero") {
    REQUIRE_FALSE(builder.Push(Line("F,0,0,100,1"), 0, &error));
    REQUIRE(error.code == ErrorCode::kInvalidIndentation);
  }
}

TEST_CASE("Empty containers flatten to their header", "[tree]") {
  std::vector<Command> root{Line("L,0,1"), Line("T,Failing,0,1")};
  const auto lines = FlattenCommands(root);
  REQUIRE(lines.has_value());
  REQUIRE(*lines == std::vector<std::string>{" L,0,1", " T,Failing,0,1"});
}

TEST_CASE("Deep nesting does not recurse", "[tree]") {
  constexpr size_t kDepth = 5000;
  Object object;
  CommandTreeBuilder builder(&object.commands);
  Error error;
  for (size_t depth = 1; depth <= kDepth; ++depth) {
    REQUIRE(builder.Push(Line("L,0,1"), depth, &error));
  }
  REQUIRE(builder.Push(Line("F,0,0,100,1"), kDepth + 1, &error));
  REQUIRE(CountCommands(object.commands) == kDepth + 1);

  const auto lines = FlattenCommands(object.commands);
  REQUIRE(lines.has_value());
  REQUIRE(lines->size() == kDepth + 1);
  REQUIRE(lines->back() == std::string(kDepth + 1, ' ') + "F,0,0,100,1");

  ReleaseCommands(&object.commands);
  REQUIRE(object.commands.empty());
}

TEST_CASE("Deep trees copy and compare without recursion", "[tree]") {
  constexpr size_t kDepth = 200000;
  Object object;
  CommandTreeBuilder builder(&object.commands);
  Error error;
  bool pushed = true;
  for (size_t depth = 1; depth <= kDepth && pushed; ++depth) {
    pushed = builder.Push(Command{Loop{0, 1, {}}}, depth, &error);
  }
  REQUIRE(pushed);
  REQUIRE(builder.Push(Line("F,0,0,100,1"), kDepth + 1, &error));

  Object copy = object;
  REQUIRE(CountCommands(copy.commands) == kDepth + 1);
  REQUIRE(copy == object);

  Command* deepest = &copy.commands.back();
  while (deepest->IsContainer() && !deepest->children()->empty()) {
    deepest = &deepest->children()->back();
  }
  std::get<Fade>(deepest->properties).start_opacity = 0;
  REQUIRE_FALSE(copy == object);

  Object assigned;
  assigned = copy;
  REQUIRE(assigned == copy);
}

TEST_CASE("Unrenderable command fails the flatten", "[tree]") {
  Move move;
  move.continuing_positions.push_back(ContinuingVector2{Decimal(1), std::nullopt});
  move.continuing_positions.push_back(ContinuingVector2{Decimal(2), Decimal(3)});
  Loop loop;
  loop.commands.push_back(Command{move});
  const std::vector<Command> root{Command{loop}};
  REQUIRE_FALSE(FlattenCommands(root).has_value());
}
