#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace fl {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// File missing / unreadable, bad gzip header, unknown encoding.
class OpenError : public Error {
public:
  OpenError(std::string path, int err, const std::string& what)
    : Error(what), path_(std::move(path)), errno_(err) {}

  const std::string& path() const noexcept { return path_; }
  int error_code() const noexcept { return errno_; } // 0 when not errno-based

private:
  std::string path_;
  int errno_;
};

// I/O or inflate failure in the middle of a scan.
class ReadError : public Error {
public:
  using Error::Error;
};

// Releasing a handle failed; the owner is closed regardless.
class CloseError : public Error {
public:
  using Error::Error;
};

// Bad JSON or field type in a view config file.
class ConfigError : public Error {
public:
  using Error::Error;
};

// Advancing an exhausted (or closed) stream.
class NoSuchElement : public std::out_of_range {
public:
  NoSuchElement() : std::out_of_range("no more lines") {}
};

}
