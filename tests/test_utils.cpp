#include "test_support.hpp"

#include "edfrec/utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main() {
  using namespace edfrec;

  assert(trim("  a b \t\n") == "a b");
  assert(trim("   ").empty());

  const auto parts = split("20,50,,7", ',');
  assert(parts.size() == 4);
  assert(parts[0] == "20");
  assert(parts[2].empty());
  assert(parts[3] == "7");

  assert(to_lower("Rec.BDF") == "rec.bdf");
  assert(ends_with("out.edf", ".edf"));
  assert(!ends_with("edf", "out.edf"));

  assert(to_int(" 42 ") == 42);
  assert(to_double("+1.5") == 1.5);
  assert(to_double("-0.25") == -0.25);

  bool threw = false;
  try {
    (void)to_int("12abc");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)to_double("1.5x");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // UTF-8 -> Latin-1: representable code points map 1:1, others become '?'.
  assert(utf8_to_latin1("M\xC3\xBCller") == "M\xFCller");
  assert(utf8_to_latin1("5 \xE2\x82\xAC") == "5 ?");
  assert(utf8_to_latin1("bad \xC3") == "bad ?");
  assert(utf8_to_latin1(std::string("a\0b", 3)) == "ab");

  assert(latin1_to_utf8("M\xFCller") == "M\xC3\xBCller");
  assert(latin1_to_utf8(utf8_to_latin1("Jos\xC3\xA9")) == "Jos\xC3\xA9");

  assert(latin1_to_header_ascii("Jos\xE9 \xC5sa") == "Jose Asa");
  assert(latin1_to_header_ascii("a\tb\xA9") == "a_b_");

  assert(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");

  std::cout << "OK\n";
  return 0;
}
