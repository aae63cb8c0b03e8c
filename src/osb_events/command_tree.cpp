#include "osb/events/command_tree.hpp"

#include <utility>

#include "osb/events/command_parser.hpp"

namespace osb::events {

bool CommandTreeBuilder::Push(Command command, size_t depth, core::Error* error) {
  const size_t current = stack_.size();
  if (depth >= 1 && depth <= current) {
    stack_.resize(depth);
  } else if (depth == current + 1 && container_opened_) {
    stack_.push_back(stack_.back()->back().children());
  } else {
    *error = core::Error::Of(core::ErrorCode::kInvalidIndentation);
    error->expected = container_opened_ ? current + 1 : current;
    error->actual = depth;
    return false;
  }

  stack_.back()->push_back(std::move(command));
  container_opened_ = stack_.back()->back().IsContainer();
  return true;
}

std::optional<std::vector<std::string>> FlattenCommands(const std::vector<Command>& commands) {
  struct Frame {
    const std::vector<Command>* commands = nullptr;
    size_t next = 0;
    size_t depth = 1;
  };

  std::vector<std::string> lines;
  std::vector<Frame> stack;
  stack.push_back(Frame{&commands, 0, 1});
  while (!stack.empty()) {
    Frame& frame = stack.back();
    if (frame.next >= frame.commands->size()) {
      stack.pop_back();
      continue;
    }
    const Command& command = (*frame.commands)[frame.next++];
    const size_t depth = frame.depth;
    const auto line = RenderCommand(command);
    if (!line.has_value()) {
      return std::nullopt;
    }
    lines.push_back(std::string(depth, ' ') + *line);

    const std::vector<Command>* children = command.children();
    if (children != nullptr && !children->empty()) {
      stack.push_back(Frame{children, 0, depth + 1});
    }
  }
  return lines;
}

size_t CountCommands(const std::vector<Command>& commands) {
  size_t count = 0;
  std::vector<const std::vector<Command>*> pending{&commands};
  while (!pending.empty()) {
    const std::vector<Command>* list = pending.back();
    pending.pop_back();
    count += list->size();
    for (const Command& command : *list) {
      if (const auto* children = command.children()) {
        pending.push_back(children);
      }
    }
  }
  return count;
}

}  // namespace osb::events
