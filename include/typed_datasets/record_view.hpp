#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace tds {

// Lightweight view over one tokenized delimited-text record.
// fields_ are column values; header_ optionally points to column names.
// Views are only valid for the duration of the record callback.
class RecordView {
public:
  RecordView() = default;
  RecordView(const std::vector<std::string_view>* header,
             const std::vector<std::string_view>* fields,
             std::uint64_t line = 0)
      : header_(header), fields_(fields), line_(line) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  // Get field by index.
  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? (*fields_)[i] : std::string_view{};
  }

  // Column name for index i (if a header is present).
  std::string_view colname(std::size_t i) const {
    return (header_ && i < header_->size()) ? (*header_)[i] : std::string_view{};
  }

  // Index of the first column called `name`.
  std::optional<std::size_t> index_of(std::string_view name) const {
    if (!header_) return std::nullopt;
    for (std::size_t i = 0; i < header_->size(); ++i)
      if ((*header_)[i] == name) return i;
    return std::nullopt;
  }

  std::optional<std::string_view> by_name(std::string_view name) const {
    auto i = index_of(name);
    if (!i || *i >= size()) return std::nullopt;
    return (*fields_)[*i];
  }

  // 1-based source line the record started on.
  std::uint64_t line() const noexcept { return line_; }

  const std::vector<std::string_view>* header() const noexcept { return header_; }

private:
  const std::vector<std::string_view>* header_{nullptr};
  const std::vector<std::string_view>* fields_{nullptr};
  std::uint64_t line_{0};
};

}
