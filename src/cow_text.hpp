#pragma once
/*
 * CowText
 *
 * Purpose: text that is either a borrowed view or an owned buffer.
 * Used for replacement values and for rendered slices.
 * Constraint: a borrowed view must outlive every CowText that refers to it.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <ostream>
#include <utility>

class CowText {
public:
  CowText() : v_(std::string_view()) {}
  static CowText borrowed(std::string_view s) { CowText t; t.v_ = s; return t; }
  static CowText owned(std::string s) { CowText t; t.v_ = std::move(s); return t; }

  bool is_borrowed() const { return std::holds_alternative<std::string_view>(v_); }
  bool is_owned() const { return !is_borrowed(); }
  std::string_view view() const {
    if (auto* sv = std::get_if<std::string_view>(&v_)) return *sv;
    return std::get<std::string>(v_);
  }
  size_t size() const { return view().size(); }
  bool empty() const { return view().empty(); }
  std::string str() const { return std::string(view()); }
  /* take the owned buffer if there is one, copy otherwise */
  std::string into_string() && {
    if (auto* s = std::get_if<std::string>(&v_)) return std::move(*s);
    return std::string(std::get<std::string_view>(v_));
  }

  friend bool operator==(const CowText& a, std::string_view b) { return a.view() == b; }
  friend bool operator==(const CowText& a, const CowText& b) { return a.view() == b.view(); }
  friend std::ostream& operator<<(std::ostream& os, const CowText& t) { return os << t.view(); }

private:
  std::variant<std::string_view, std::string> v_;
};
