#include "typed_datasets/token_csv_fsm.hpp"
#include "typed_datasets/arena.hpp"
#include "typed_datasets/record_view.hpp"
#include <string_view>
#include <vector>

namespace tds {

struct CsvState {
  std::vector<std::string_view> header;
  std::vector<std::string_view> fields;
  bool has_header{false};
  std::uint64_t line{1};
};

struct CsvFsm::Impl {
  CsvConfig cfg;
  Arena& header_arena;
  Arena& row_arena;
  CsvState st;

  // Collapse doubled quotes into row_arena storage.
  std::string_view unescape(std::string_view raw) {
    char* out = static_cast<char*>(row_arena.alloc(raw.size()));
    std::size_t n = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
      out[n++] = raw[i];
      if (raw[i] == cfg.quote && i + 1 < raw.size() && raw[i + 1] == cfg.quote) ++i;
    }
    return std::string_view(out, n);
  }

  // Parse one record starting at p; advances p past its terminator.
  bool parse_record(const char*& p, const char* e, std::string& err) {
    st.fields.clear();
    enum class Mode { FieldStart, Unquoted, Quoted, AfterQuote } mode = Mode::FieldStart;
    const char* field_start = p;
    bool escaped = false;

    while (true) {
      const bool at_end = (p >= e);
      const char c = at_end ? '\n' : *p;

      switch (mode) {
        case Mode::FieldStart:
          if (!at_end && c == cfg.quote) {
            mode = Mode::Quoted;
            field_start = p + 1;
            escaped = false;
            ++p;
            continue;
          }
          mode = Mode::Unquoted;
          field_start = p;
          continue;  // re-examine c as unquoted

        case Mode::Unquoted:
          if (c == cfg.delimiter || c == '\n') {
            const char* end = at_end ? e : p;
            if (c == '\n' && end > field_start && end[-1] == '\r') --end;
            st.fields.emplace_back(field_start, static_cast<std::size_t>(end - field_start));
            if (at_end) return true;
            ++p;
            if (c == '\n') { ++st.line; return true; }
            mode = Mode::FieldStart;
            if (p >= e) { st.fields.emplace_back(); return true; }  // trailing delimiter
          } else {
            ++p;
          }
          break;

        case Mode::Quoted:
          if (at_end) {
            err = "line " + std::to_string(st.line) + ": unterminated quoted field";
            return false;
          }
          if (c == cfg.quote) {
            if (p + 1 < e && p[1] == cfg.quote) { escaped = true; p += 2; continue; }
            std::string_view raw(field_start, static_cast<std::size_t>(p - field_start));
            st.fields.push_back(escaped ? unescape(raw) : raw);
            mode = Mode::AfterQuote;
            ++p;
            continue;
          }
          if (c == '\n') ++st.line;
          ++p;
          break;

        case Mode::AfterQuote:
          if (!at_end && c == '\r' && (p + 1 >= e || p[1] == '\n')) { ++p; continue; }
          if (at_end) return true;
          if (c == '\n') { ++p; ++st.line; return true; }
          if (c == cfg.delimiter) {
            ++p;
            mode = Mode::FieldStart;
            if (p >= e) { st.fields.emplace_back(); return true; }
            break;
          }
          err = "line " + std::to_string(st.line) + ": unexpected character after closing quote";
          return false;
      }
    }
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg, Arena& header_arena, Arena& row_arena)
  : p_(new Impl{cfg, header_arena, row_arena, CsvState{}}), rows_(0) {}

CsvFsm::~CsvFsm() { delete p_; }

const std::vector<std::string_view>& CsvFsm::header() const { return p_->st.header; }

bool CsvFsm::feed(std::string_view data, const RecordCallback& on_record) {
  if (data.size() >= 3 && data.compare(0, 3, "\xEF\xBB\xBF") == 0) data.remove_prefix(3);

  const char* p = data.data();
  const char* e = p + data.size();
  auto& st = p_->st;

  while (p < e) {
    // Blank line
    if (*p == '\n') { ++p; ++st.line; continue; }
    if (*p == '\r' && (p + 1 == e || p[1] == '\n')) {
      p += (p + 1 == e) ? 1 : 2;
      ++st.line;
      continue;
    }

    const std::uint64_t record_line = st.line;
    if (!p_->parse_record(p, e, err_)) return false;

    if (p_->cfg.header && !st.has_header) {
      // Copy header tokens into the header_arena so they survive row_arena resets.
      st.header.clear();
      st.header.reserve(st.fields.size());
      for (auto sv : st.fields) st.header.emplace_back(p_->header_arena.copy(sv));
      st.has_header = true;
      p_->row_arena.reset();
      continue;
    }

    RecordView rv(p_->cfg.header ? &st.header : nullptr, &st.fields, record_line);
    const bool keep_going = on_record(rv);
    ++rows_;
    p_->row_arena.reset();
    if (!keep_going) return false;
  }
  return true;
}

}
