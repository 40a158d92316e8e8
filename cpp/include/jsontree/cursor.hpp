#pragma once

#include <cstddef>
#include <string_view>

namespace jsontree {

// Read position over an immutable document. Parsers advance it on success;
// alternation restores it with reset().
class Cursor {
 public:
  explicit Cursor(std::string_view text, std::size_t pos = 0) : text_(text), pos_(pos) {}

  std::size_t pos() const { return pos_; }
  std::size_t size() const { return text_.size(); }
  bool at_end() const { return pos_ >= text_.size(); }

  // '\0' at end of input.
  char peek() const { return at_end() ? '\0' : text_[pos_]; }
  bool peek_is(char c) const { return !at_end() && text_[pos_] == c; }
  bool starts_with(std::string_view word) const { return rest().substr(0, word.size()) == word; }

  std::string_view rest() const { return at_end() ? std::string_view{} : text_.substr(pos_); }
  std::string_view slice(std::size_t begin, std::size_t end) const { return text_.substr(begin, end - begin); }
  std::string_view text() const { return text_; }

  void advance(std::size_t n = 1) { pos_ = (pos_ + n < text_.size()) ? pos_ + n : text_.size(); }
  void reset(std::size_t pos) { pos_ = pos; }

 private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

}  // namespace jsontree
