#pragma once

#include <string>
#include <vector>

// One statement inside a block:
//   reverse_proxy /api/* localhost:8080
//   handle /static/* { file_server }
// `args` keeps the literal token text, quotes included. A directive with a
// nested block never has arguments after its opening brace.
class DirectiveNode {
 public:
  DirectiveNode();
  DirectiveNode(const std::string& name, const std::vector<std::string>& args);
  DirectiveNode(const DirectiveNode& other);
  DirectiveNode& operator=(const DirectiveNode& other);
  ~DirectiveNode();

  bool hasBlock() const;
  // First argument, or empty string.
  std::string firstArg() const;

  std::string name;
  std::vector<std::string> args;
  std::vector<DirectiveNode> block;
  // Name and arguments joined by single spaces, as read from the source.
  std::string raw_line;
  // Set when the source opened a block, even an empty one.
  bool has_block;
};

typedef std::vector<DirectiveNode> DirectiveList;

bool operator==(const DirectiveNode& lhs, const DirectiveNode& rhs);
bool operator!=(const DirectiveNode& lhs, const DirectiveNode& rhs);
