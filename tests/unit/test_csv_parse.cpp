#include "typed_datasets/csv_parse.hpp"
#include <iostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

struct AB {
  int a = 0;
  int b = 0;
};

struct Flower {
  double sepal = 0.0;
  std::string species;
};

namespace tds {
template <>
struct NamedRecordDecoder<AB> {
  static bool decode(const RecordView& rv, AB& out, std::string& err) {
    return field_named(rv, "a", out.a, err) && field_named(rv, "b", out.b, err);
  }
};

template <>
struct RecordDecoder<Flower> {
  static bool decode(const RecordView& rv, Flower& out, std::string& err) {
    return expect_arity(rv, 2, err) &&
           field_at(rv, 0, out.sepal, err) &&
           field_at(rv, 1, out.species, err, [](std::string_view s) {
             return Result<std::string>(dashes_to_camel_case(s));
           });
  }
};
}

int main() {
  int failures = 0;
  auto fail = [&](const std::string& m) { std::cerr << "[FAIL] " << m << "\n"; ++failures; };

  // Headerless, positional pairs, input order preserved.
  {
    auto r = tds::parse_delimited<std::pair<int, int>>("1,2\n3,4\n");
    if (!r) fail("pairs: " + r.error().to_string());
    else if (r.value() != std::vector<std::pair<int, int>>{{1, 2}, {3, 4}}) fail("pairs contents");
  }

  // Headered with ';'.
  {
    auto r = tds::parse_delimited_headered<AB>("a;b\n1;2\n", ';');
    if (!r) fail("headered ';': " + r.error().to_string());
    else if (r.value().size() != 1 || r.value()[0].a != 1 || r.value()[0].b != 2) fail("headered contents");
  }

  // Columns are matched by name, not position.
  {
    auto r = tds::parse_delimited_headered<AB>("b,extra,a\n20,x,10\n");
    if (!r) fail("by name: " + r.error().to_string());
    else if (r.value()[0].a != 10 || r.value()[0].b != 20) fail("by name contents");
  }

  // Tuples and custom field readers.
  {
    auto r = tds::parse_delimited<std::tuple<int, double, std::string>>("1,2.5,x\n");
    if (!r || std::get<1>(r.value()[0]) != 2.5 || std::get<2>(r.value()[0]) != "x") fail("tuple");
    auto f = tds::parse_delimited<Flower>("5.1,Iris-setosa\n");
    if (!f || f.value()[0].species != "IrisSetosa") fail("custom reader");
  }

  // A bad field anywhere fails the whole load, naming line and field.
  {
    auto r = tds::parse_delimited<std::pair<int, int>>("1,2\n3,x\n5,6\n");
    if (r) fail("bad field accepted");
    else {
      if (r.error().kind != tds::ErrorKind::Parse) fail("bad field kind");
      if (r.error().context.find("line 2") == std::string::npos) fail("bad field line: " + r.error().context);
      if (r.error().context.find("unknown") == std::string::npos) fail("bad field reason: " + r.error().context);
    }
  }

  // Arity and header width mismatches.
  {
    if (tds::parse_delimited<std::pair<int, int>>("1,2,3\n")) fail("arity mismatch accepted");
    if (tds::parse_delimited_headered<AB>("a,b\n1\n")) fail("short row accepted");
    if (tds::parse_delimited_headered<AB>("a,c\n1,2\n")) fail("missing column accepted");
    if (tds::parse_delimited_headered<AB>("")) fail("missing header accepted");
  }

  // Tokenizer errors surface as parse errors.
  {
    auto r = tds::parse_delimited<std::vector<std::string>>("\"open\n");
    if (r || r.error().kind != tds::ErrorKind::Parse) fail("unterminated quote");
  }

  // Header only: no records.
  {
    auto r = tds::parse_delimited_headered<AB>("a,b\n");
    if (!r || !r.value().empty()) fail("header only");
  }

  if (failures) return 1;
  std::cout << "[PASS] csv parse\n";
  return 0;
}
