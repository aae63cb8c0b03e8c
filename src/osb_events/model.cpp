#include "osb/events/model.hpp"

#include <utility>

namespace osb::events {
namespace {

// The command's own fields; Loop/Trigger come back with an empty child list.
CommandProperties ShallowCopy(const CommandProperties& properties) {
  if (const auto* loop = std::get_if<Loop>(&properties)) {
    Loop out;
    out.start_time = loop->start_time;
    out.loop_count = loop->loop_count;
    return out;
  }
  if (const auto* trigger = std::get_if<Trigger>(&properties)) {
    Trigger out;
    out.trigger_type = trigger->trigger_type;
    out.start_time = trigger->start_time;
    out.end_time = trigger->end_time;
    out.group_number = trigger->group_number;
    return out;
  }
  return properties;
}

// Compares everything except Loop/Trigger children.
bool ShallowEqual(const CommandProperties& a, const CommandProperties& b) {
  if (a.index() != b.index()) {
    return false;
  }
  if (const auto* loop = std::get_if<Loop>(&a)) {
    const auto& other = std::get<Loop>(b);
    return loop->start_time == other.start_time && loop->loop_count == other.loop_count;
  }
  if (const auto* trigger = std::get_if<Trigger>(&a)) {
    const auto& other = std::get<Trigger>(b);
    return trigger->trigger_type == other.trigger_type && trigger->start_time == other.start_time &&
           trigger->end_time == other.end_time && trigger->group_number == other.group_number;
  }
  return a == b;
}

bool CommandListsEqual(const std::vector<Command>& a, const std::vector<Command>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!(a[i] == b[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool operator==(const Loop& a, const Loop& b) {
  return a.start_time == b.start_time && a.loop_count == b.loop_count && CommandListsEqual(a.commands, b.commands);
}

bool operator==(const Trigger& a, const Trigger& b) {
  return a.trigger_type == b.trigger_type && a.start_time == b.start_time && a.end_time == b.end_time &&
         a.group_number == b.group_number && CommandListsEqual(a.commands, b.commands);
}

bool operator==(const Command& a, const Command& b) {
  std::vector<std::pair<const Command*, const Command*>> pending{{&a, &b}};
  while (!pending.empty()) {
    const auto [left, right] = pending.back();
    pending.pop_back();
    if (!ShallowEqual(left->properties, right->properties)) {
      return false;
    }
    const std::vector<Command>* left_children = left->children();
    const std::vector<Command>* right_children = right->children();
    if (left_children == nullptr) {
      continue;
    }
    if (left_children->size() != right_children->size()) {
      return false;
    }
    for (size_t i = 0; i < left_children->size(); ++i) {
      pending.emplace_back(&(*left_children)[i], &(*right_children)[i]);
    }
  }
  return true;
}

Command::Command(const Command& other) : properties(ShallowCopy(other.properties)) {
  struct Frame {
    const std::vector<Command>* source;
    std::vector<Command>* target;
  };

  std::vector<Frame> stack;
  if (const auto* source = other.children()) {
    stack.push_back(Frame{source, children()});
  }
  while (!stack.empty()) {
    const Frame frame = stack.back();
    stack.pop_back();
    // Filled completely before any child pointer is taken, so targets stay put.
    frame.target->reserve(frame.source->size());
    for (const Command& child : *frame.source) {
      frame.target->push_back(Command(ShallowCopy(child.properties)));
    }
    for (size_t i = 0; i < frame.source->size(); ++i) {
      const std::vector<Command>* source = (*frame.source)[i].children();
      if (source != nullptr && !source->empty()) {
        stack.push_back(Frame{source, (*frame.target)[i].children()});
      }
    }
  }
}

Command& Command::operator=(const Command& other) {
  if (this != &other) {
    Command copy(other);
    *this = std::move(copy);
  }
  return *this;
}

Command::~Command() {
  std::vector<Command>* list = children();
  if (list != nullptr && !list->empty()) {
    ReleaseCommands(list);
  }
}

void ReleaseCommands(std::vector<Command>* commands) {
  std::vector<Command> pending = std::move(*commands);
  commands->clear();
  while (!pending.empty()) {
    Command command = std::move(pending.back());
    pending.pop_back();
    if (auto* children = command.children()) {
      for (Command& child : *children) {
        pending.push_back(std::move(child));
      }
      children->clear();
    }
  }
}

std::vector<Command>* Command::children() {
  if (auto* loop = std::get_if<Loop>(&properties)) {
    return &loop->commands;
  }
  if (auto* trigger = std::get_if<Trigger>(&properties)) {
    return &trigger->commands;
  }
  return nullptr;
}

const std::vector<Command>* Command::children() const {
  if (const auto* loop = std::get_if<Loop>(&properties)) {
    return &loop->commands;
  }
  if (const auto* trigger = std::get_if<Trigger>(&properties)) {
    return &trigger->commands;
  }
  return nullptr;
}

const FilePath& Object::filepath() const {
  if (const auto* animation = std::get_if<Animation>(&object_type)) {
    return animation->filepath;
  }
  return std::get<Sprite>(object_type).filepath;
}

}  // namespace osb::events
