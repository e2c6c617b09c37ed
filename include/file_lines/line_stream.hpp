#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>

namespace fl {

class LineReader;

// One read session over a file: a single reusable line buffer plus one line
// of lookahead. Closes itself at end of stream, on close(), or on
// destruction. Not for concurrent use, except close() racing close().
//
// Lines handed out by borrow_next() alias the internal buffer and are
// overwritten by the next has_more()/borrow_next()/take_next().
class LineStream {
public:
  // Single-pass input iterator over borrowed lines.
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::string;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const std::string*;
    using reference         = const std::string&;

    Iterator() = default;
    explicit Iterator(LineStream* s);

    reference operator*() const { return *line_; }
    pointer operator->() const { return line_; }
    Iterator& operator++();

    friend bool operator==(const Iterator& a, const Iterator& b) { return a.s_ == b.s_; }
    friend bool operator!=(const Iterator& a, const Iterator& b) { return a.s_ != b.s_; }

  private:
    LineStream* s_{nullptr};
    const std::string* line_{nullptr};
  };

  explicit LineStream(std::unique_ptr<LineReader> reader);
  ~LineStream();

  LineStream(const LineStream&) = delete;
  LineStream& operator=(const LineStream&) = delete;

  // Reads ahead at most one line. Repeated calls without a borrow/take in
  // between do no I/O. Throws ReadError.
  bool has_more();

  // Next line as a view of the internal buffer. Throws NoSuchElement.
  const std::string& borrow_next();

  // Next line as an owned copy. Throws NoSuchElement.
  std::string take_next();

  // Idempotent. Throws CloseError, the stream is terminal either way.
  void close();

  bool is_closed() const;
  std::uint64_t bytes_read() const;

  Iterator begin() { return Iterator(this); }
  Iterator end() { return Iterator(); }

private:
  std::unique_ptr<LineReader> reader_;
  std::string buffer_;
  bool pending_{false};
  bool advance_needed_{true};
  std::uint64_t bytes_at_close_{0};
  mutable std::mutex close_mu_;
};

}
