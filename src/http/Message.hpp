#pragma once

#include <string>
#include <vector>

class Header {
 public:
  Header();
  Header(const std::string& n, const std::string& v);
  Header(const Header& other);
  Header& operator=(const Header& other);
  ~Header();

  std::string name;
  std::string value;
};

// Headers plus body shared by requests and responses. Header lookups are
// case-insensitive; insertion order is kept for serialization.
class Message {
 public:
  Message();
  Message(const Message& other);
  Message& operator=(const Message& other);
  virtual ~Message();

  void addHeader(const std::string& name, const std::string& value);
  // Replaces every header called `name` with a single one.
  void setHeader(const std::string& name, const std::string& value);
  bool getHeader(const std::string& name, std::string& out) const;
  bool hasHeader(const std::string& name) const;
  std::vector<std::string> getHeaders(const std::string& name) const;
  const std::vector<Header>& headers() const;
  void clearHeaders();

  std::string serializeHeaders() const;
  static bool parseHeaderLine(const std::string& line, Header& out);

  virtual std::string startLine() const = 0;
  virtual std::string serialize() const;

  std::string body;

 protected:
  std::vector<Header> headers_;
};
