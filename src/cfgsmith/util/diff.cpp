#include "cfgsmith/util/diff.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <span>
#include <vector>

namespace cfgsmith::util {

namespace {

// Above this many LCS cells the changed region is emitted as one
// delete-then-insert block instead.
inline constexpr std::size_t kMaxLcsCells = 4UZ * 1024 * 1024;

enum class OpKind : std::uint8_t { Equal, Delete, Insert };

struct DiffOp {
  OpKind kind;
  std::string_view line;
};

// Lines keep their '\n' terminator so that joining them yields the input.
auto split_lines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, nl - pos + 1));
    pos = nl + 1;
  }
  return lines;
}

auto diff_middle(std::span<const std::string_view> a,
                 std::span<const std::string_view> b, std::vector<DiffOp> &out)
    -> void {
  const auto n = a.size();
  const auto m = b.size();
  if ((n + 1) * (m + 1) > kMaxLcsCells) {
    for (auto line : a) {
      out.push_back({OpKind::Delete, line});
    }
    for (auto line : b) {
      out.push_back({OpKind::Insert, line});
    }
    return;
  }

  // lcs[i][j] = LCS length of a[i..] and b[j..]
  std::vector<std::uint32_t> lcs((n + 1) * (m + 1), 0);
  auto at = [m](std::size_t i, std::size_t j) { return i * (m + 1) + j; };
  for (std::size_t i = n; i-- > 0;) {
    for (std::size_t j = m; j-- > 0;) {
      lcs[at(i, j)] = (a[i] == b[j])
                          ? lcs[at(i + 1, j + 1)] + 1
                          : std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
    }
  }

  std::size_t i = 0;
  std::size_t j = 0;
  while (i < n && j < m) {
    if (a[i] == b[j]) {
      out.push_back({OpKind::Equal, a[i]});
      ++i;
      ++j;
    } else if (lcs[at(i + 1, j)] >= lcs[at(i, j + 1)]) {
      out.push_back({OpKind::Delete, a[i++]});
    } else {
      out.push_back({OpKind::Insert, b[j++]});
    }
  }
  for (; i < n; ++i) {
    out.push_back({OpKind::Delete, a[i]});
  }
  for (; j < m; ++j) {
    out.push_back({OpKind::Insert, b[j]});
  }
}

auto edit_script(std::string_view old_text, std::string_view new_text)
    -> std::vector<DiffOp> {
  const auto a = split_lines(old_text);
  const auto b = split_lines(new_text);

  std::size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
    ++prefix;
  }
  std::size_t suffix = 0;
  while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
         a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
    ++suffix;
  }

  std::vector<DiffOp> ops;
  ops.reserve(std::max(a.size(), b.size()));
  for (std::size_t k = 0; k < prefix; ++k) {
    ops.push_back({OpKind::Equal, a[k]});
  }
  diff_middle(std::span(a).subspan(prefix, a.size() - prefix - suffix),
              std::span(b).subspan(prefix, b.size() - prefix - suffix), ops);
  for (std::size_t k = a.size() - suffix; k < a.size(); ++k) {
    ops.push_back({OpKind::Equal, a[k]});
  }
  return ops;
}

auto range_spec(std::size_t start, std::size_t count) -> std::string {
  if (count == 1) {
    return fmt::format("{}", start);
  }
  return fmt::format("{},{}", count == 0 ? start - 1 : start, count);
}

auto append_line(std::string &out, char marker, std::string_view line)
    -> void {
  out.push_back(marker);
  out.append(line);
  if (line.empty() || line.back() != '\n') {
    out.append("\n\\ No newline at end of file\n");
  }
}

} // namespace

auto unified_diff(std::string_view old_text, std::string_view new_text,
                  std::string_view old_label, std::string_view new_label,
                  std::size_t context) -> std::string {
  if (old_text == new_text) {
    return {};
  }

  const auto ops = edit_script(old_text, new_text);
  const auto n = ops.size();

  // 1-based line numbers of the next old/new line at each op index.
  std::vector<std::size_t> old_line(n + 1, 1);
  std::vector<std::size_t> new_line(n + 1, 1);
  for (std::size_t k = 0; k < n; ++k) {
    old_line[k + 1] = old_line[k] + (ops[k].kind != OpKind::Insert ? 1 : 0);
    new_line[k + 1] = new_line[k] + (ops[k].kind != OpKind::Delete ? 1 : 0);
  }

  auto is_change = [&](std::size_t k) { return ops[k].kind != OpKind::Equal; };

  std::string out;
  fmt::format_to(std::back_inserter(out), "--- {}\n+++ {}\n", old_label,
                 new_label);

  std::size_t idx = 0;
  while (idx < n) {
    auto first = idx;
    while (first < n && !is_change(first)) {
      ++first;
    }
    if (first == n) {
      break;
    }

    auto last = first;
    auto j = first;
    while (j < n) {
      if (is_change(j)) {
        last = j++;
        continue;
      }
      auto k = j;
      while (k < n && !is_change(k)) {
        ++k;
      }
      if (k < n && k - j <= 2 * context) {
        j = k;
        continue;
      }
      break;
    }

    const auto start = first > context ? first - context : 0;
    const auto stop = std::min(n, last + 1 + context);

    std::size_t old_count = 0;
    std::size_t new_count = 0;
    for (auto k = start; k < stop; ++k) {
      old_count += ops[k].kind != OpKind::Insert ? 1 : 0;
      new_count += ops[k].kind != OpKind::Delete ? 1 : 0;
    }

    fmt::format_to(std::back_inserter(out), "@@ -{} +{} @@\n",
                   range_spec(old_line[start], old_count),
                   range_spec(new_line[start], new_count));
    for (auto k = start; k < stop; ++k) {
      switch (ops[k].kind) {
      case OpKind::Equal:
        append_line(out, ' ', ops[k].line);
        break;
      case OpKind::Delete:
        append_line(out, '-', ops[k].line);
        break;
      case OpKind::Insert:
        append_line(out, '+', ops[k].line);
        break;
      }
    }
    idx = stop;
  }
  return out;
}

} // namespace cfgsmith::util
