#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "osb/core/error.hpp"
#include "osb/events/model.hpp"

namespace osb::events {

// Attaches indented command lines to their owner. Depth 1 appends to the root
// list; a Loop/Trigger pushed on the previous call may be entered one level
// deeper. Nesting is tracked with an explicit stack of child lists.
//
// The root list must outlive the builder and must not be modified by anything
// else while the builder is in use.
class CommandTreeBuilder {
 public:
  explicit CommandTreeBuilder(std::vector<Command>* root) : stack_{root} {}

  bool Push(Command command, size_t depth, core::Error* error);

  [[nodiscard]] size_t depth() const { return stack_.size(); }

 private:
  std::vector<std::vector<Command>*> stack_;
  bool container_opened_ = false;
};

// One line per command, prefixed by one space per nesting level (top level is
// depth 1). nullopt when a command has no textual form.
std::optional<std::vector<std::string>> FlattenCommands(const std::vector<Command>& commands);

// Number of commands in the forest, container contents included.
size_t CountCommands(const std::vector<Command>& commands);

}  // namespace osb::events
