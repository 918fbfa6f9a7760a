#include <iostream>
#include <stdexcept>
#include <string>

#include "driftgrid/util/json.h"

#define DG_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";           \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

std::string parse_error(const std::string& text) {
  try {
    (void)driftgrid::json::parse(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_json() {
  using namespace driftgrid;

  // Basic values.
  {
    const json::Value v = json::parse(R"({"a": [1, -2.5e1, true, null], "s": "x\ty", "o": {}})");
    DG_ASSERT(v.is_object());
    const json::Array& a = v.find("a")->array();
    DG_ASSERT(a.size() == 4);
    DG_ASSERT(*a[0].as_number() == 1.0);
    DG_ASSERT(*a[1].as_number() == -25.0);
    DG_ASSERT(*a[2].as_bool());
    DG_ASSERT(a[3].is_null());
    DG_ASSERT(*v.find("s")->as_string() == "x\ty");
    DG_ASSERT(v.find("o")->object().empty());
    DG_ASSERT(v.find("missing") == nullptr);
    DG_ASSERT(a[0].find("a") == nullptr);
  }

  // Unicode escapes, including a surrogate pair, decode to UTF-8.
  {
    const json::Value v = json::parse(R"(["\u00e9", "\ud83d\ude00"])");
    DG_ASSERT(*v.array()[0].as_string() == "\xC3\xA9");
    DG_ASSERT(*v.array()[1].as_string() == "\xF0\x9F\x98\x80");
  }

  // Leading BOM is skipped.
  {
    const json::Value v = json::parse("\xEF\xBB\xBF{\"k\": 2}");
    DG_ASSERT(*v.find("k")->as_number() == 2.0);
  }

  // Errors carry line and column.
  {
    const std::string err = parse_error("{\n  \"a\": 1,\n  \"b\": x\n}");
    DG_ASSERT(err.find("line 3, col 8") != std::string::npos);
    DG_ASSERT(err.find("unexpected character") != std::string::npos);

    DG_ASSERT(parse_error("[1, 2").find("expected ']'") != std::string::npos);
    DG_ASSERT(parse_error("{\"a\": 1} x").find("trailing characters") != std::string::npos);
    DG_ASSERT(parse_error("\"abc").find("unterminated string") != std::string::npos);
    DG_ASSERT(!parse_error("{1: 2}").empty());
    DG_ASSERT(!parse_error("tru").empty());
    DG_ASSERT(!parse_error("").empty());
  }

  // Nesting is bounded; reasonable depth still parses.
  {
    const std::string deep = std::string(100000, '[') + std::string(100000, ']');
    DG_ASSERT(parse_error(deep).find("nesting too deep") != std::string::npos);

    std::string objs;
    for (int k = 0; k < 300; ++k) objs += "{\"a\":";
    objs += "1" + std::string(300, '}');
    DG_ASSERT(parse_error(objs).find("nesting too deep") != std::string::npos);

    const std::string ok = std::string(200, '[') + std::string(200, ']');
    DG_ASSERT(parse_error(ok).empty());
    DG_ASSERT(parse_error(std::string(256, '[') + std::string(256, ']')).empty());
    DG_ASSERT(!parse_error(std::string(257, '[') + std::string(257, ']')).empty());
  }

  // Type-checked accessors throw.
  {
    const json::Value v = json::parse("[1]");
    bool threw = false;
    try {
      (void)v.object();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    DG_ASSERT(threw);
  }

  // Output is compact when indent is 0, keys sorted, integers without a fraction.
  {
    const json::Value v = json::parse(R"({"b": 1, "a": [true, null], "c": 0.25, "d": "q\"uote"})");
    DG_ASSERT(json::stringify(v, 0) == R"({"a":[true,null],"b":1,"c":0.25,"d":"q\"uote"})");

    const std::string pretty = json::stringify(json::parse(R"({"k": [1]})"), 2);
    DG_ASSERT(pretty == "{\n  \"k\": [\n    1\n  ]\n}");
  }

  // Doubles read back exactly.
  {
    const double tricky = 0.1 + 0.2;
    json::Array arr;
    arr.push_back(tricky);
    arr.push_back(1.0 / 3.0);
    arr.push_back(0.012);
    const json::Value back = json::parse(json::stringify(json::Value(arr), 0));
    DG_ASSERT(*back.array()[0].as_number() == tricky);
    DG_ASSERT(*back.array()[1].as_number() == 1.0 / 3.0);
    DG_ASSERT(*back.array()[2].as_number() == 0.012);
    DG_ASSERT(json::stringify(back.array()[2], 0) == "0.012");
  }

  return 0;
}
