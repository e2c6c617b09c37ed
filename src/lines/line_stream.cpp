#include "file_lines/line_stream.hpp"
#include "file_lines/errors.hpp"
#include "file_lines/line_reader.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace fl {

LineStream::Iterator::Iterator(LineStream* s) : s_(s) {
  if (s_->has_more()) line_ = &s_->borrow_next();
  else s_ = nullptr;
}

LineStream::Iterator& LineStream::Iterator::operator++() {
  if (s_->has_more()) {
    line_ = &s_->borrow_next();
  } else {
    s_ = nullptr;
    line_ = nullptr;
  }
  return *this;
}

LineStream::LineStream(std::unique_ptr<LineReader> reader) : reader_(std::move(reader)) {}

LineStream::~LineStream() {
  try {
    close();
  } catch (const std::exception& e) {
    std::cerr << "[lines] close on destruction failed: " << e.what() << "\n";
  }
}

bool LineStream::has_more() {
  if (!advance_needed_) return pending_;
  if (!reader_) {
    pending_ = false;
    advance_needed_ = false;
    return false;
  }

  pending_ = reader_->read_line(buffer_);
  advance_needed_ = false;
  if (!pending_) close();
  return pending_;
}

const std::string& LineStream::borrow_next() {
  if (!has_more()) throw NoSuchElement();
  advance_needed_ = true;
  return buffer_;
}

std::string LineStream::take_next() {
  return borrow_next();
}

void LineStream::close() {
  std::unique_ptr<LineReader> r;
  {
    std::lock_guard<std::mutex> lk(close_mu_);
    if (!reader_) return;
    r = std::move(reader_);
    bytes_at_close_ = r->bytes_read();
    pending_ = false;
    advance_needed_ = false;
  }
  r->close();
}

bool LineStream::is_closed() const {
  std::lock_guard<std::mutex> lk(close_mu_);
  return !reader_;
}

std::uint64_t LineStream::bytes_read() const {
  std::lock_guard<std::mutex> lk(close_mu_);
  return reader_ ? reader_->bytes_read() : bytes_at_close_;
}

}
