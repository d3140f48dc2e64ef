#include "ConfigFile.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "Errors.hpp"
#include "Logger.hpp"
#include "constants.hpp"

ConfigFile::ConfigFile(const std::string& path) : path_(path) {}

const std::string& ConfigFile::path() const {
  return path_;
}

bool ConfigFile::exists() const {
  struct stat st;
  return stat(path_.c_str(), &st) == 0;
}

std::string ConfigFile::read() const {
  struct stat st;
  if (stat(path_.c_str(), &st) < 0 && errno == ENOENT) {
    LOG(ERROR) << "Caddyfile not found: " << path_;
    throw CaddyfileNotFound(path_);
  }

  std::ifstream file(path_.c_str());
  if (!file.is_open()) {
    std::string msg =
        "Cannot open Caddyfile " + path_ + ": " + std::strerror(errno);
    LOG(ERROR) << msg;
    throw std::runtime_error(msg);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    std::string msg = "Error reading Caddyfile " + path_;
    LOG(ERROR) << msg;
    throw std::runtime_error(msg);
  }
  return buffer.str();
}

namespace {

void writeAll(int fd, const std::string& content, const std::string& path) {
  size_t written = 0;
  while (written < content.size()) {
    ssize_t n =
        ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::string msg = "write(" + path + "): " + std::strerror(errno);
      LOG(ERROR) << msg;
      throw std::runtime_error(msg);
    }
    written += static_cast<size_t>(n);
  }
}

}  // namespace

void ConfigFile::write(const std::string& content) const {
  std::string tmp_path = path_ + ".tmp.XXXXXX";
  std::vector<char> tmpl(tmp_path.begin(), tmp_path.end());
  tmpl.push_back('\0');

  int fd = mkstemp(&tmpl[0]);
  if (fd < 0) {
    std::string msg =
        "Cannot create temporary file for " + path_ + ": " +
        std::strerror(errno);
    LOG(ERROR) << msg;
    throw std::runtime_error(msg);
  }
  tmp_path = &tmpl[0];

  try {
    writeAll(fd, content, tmp_path);
    if (fchmod(fd, CADDYFILE_FILE_MODE) < 0 || fsync(fd) < 0) {
      std::string msg = "Cannot finalize " + tmp_path + ": " +
                        std::strerror(errno);
      LOG(ERROR) << msg;
      throw std::runtime_error(msg);
    }
  } catch (const std::exception&) {
    close(fd);
    unlink(tmp_path.c_str());
    throw;
  }
  close(fd);

  if (rename(tmp_path.c_str(), path_.c_str()) < 0) {
    std::string msg = "Cannot replace " + path_ + ": " + std::strerror(errno);
    unlink(tmp_path.c_str());
    LOG(ERROR) << msg;
    throw std::runtime_error(msg);
  }
  LOG(INFO) << "Wrote " << content.size() << " bytes to " << path_;
}
