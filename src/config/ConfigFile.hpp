#pragma once

#include <string>

// The Caddyfile on disk.
class ConfigFile {
 public:
  explicit ConfigFile(const std::string& path);

  // Whole file content. Throws CaddyfileNotFound when the file does not
  // exist and std::runtime_error for any other read failure.
  std::string read() const;

  bool exists() const;
  const std::string& path() const;

  // Replaces the file with `content` through a temporary file in the same
  // directory and rename(2), so readers never see a partial file.
  void write(const std::string& content) const;

 private:
  std::string path_;
};
