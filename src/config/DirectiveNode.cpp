#include "DirectiveNode.hpp"

DirectiveNode::DirectiveNode()
    : name(), args(), block(), raw_line(), has_block(false) {}

DirectiveNode::DirectiveNode(const std::string& n,
                             const std::vector<std::string>& a)
    : name(n), args(a), block(), raw_line(), has_block(false) {}

DirectiveNode::DirectiveNode(const DirectiveNode& other)
    : name(other.name),
      args(other.args),
      block(other.block),
      raw_line(other.raw_line),
      has_block(other.has_block) {}

DirectiveNode& DirectiveNode::operator=(const DirectiveNode& other) {
  if (this != &other) {
    name = other.name;
    args = other.args;
    block = other.block;
    raw_line = other.raw_line;
    has_block = other.has_block;
  }
  return *this;
}

DirectiveNode::~DirectiveNode() {}

bool DirectiveNode::hasBlock() const {
  return has_block || !block.empty();
}

std::string DirectiveNode::firstArg() const {
  if (args.empty()) {
    return "";
  }
  return args[0];
}

// raw_line is not compared: it is source text, not structure.
bool operator==(const DirectiveNode& lhs, const DirectiveNode& rhs) {
  return lhs.name == rhs.name && lhs.args == rhs.args &&
         lhs.hasBlock() == rhs.hasBlock() && lhs.block == rhs.block;
}

bool operator!=(const DirectiveNode& lhs, const DirectiveNode& rhs) {
  return !(lhs == rhs);
}
