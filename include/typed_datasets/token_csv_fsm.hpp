#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tds {

class Arena;
class RecordView;

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool header    = true;
};

// Delimited-text tokenizer over a complete in-memory payload.
// Quoted fields may contain delimiters, newlines and doubled quotes.
// LF and CRLF line endings; blank lines are skipped; a leading UTF-8 BOM is
// ignored.
class CsvFsm {
public:
  // Return false to stop tokenizing.
  using RecordCallback = std::function<bool(const RecordView&)>;

  // Split arenas: headers live in `header_arena`, unescaped row fields in
  // `row_arena` (reset after every record).
  CsvFsm(const CsvConfig& cfg, Arena& header_arena, Arena& row_arena);
  ~CsvFsm();
  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // False on malformed input (see error()) or when the callback stops.
  bool feed(std::string_view data, const RecordCallback& on_record);

  const std::vector<std::string_view>& header() const;
  const std::string& error() const { return err_; }
  std::uint64_t rows() const { return rows_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t rows_{0};
  std::string err_;
};

}
