#include "esc.hpp"

#include <iostream>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  auto const s0 = "\a\xa0\b\t\n\v\f\r\\";
  CHECK_EQ(esc(s0), "\\a\\xa0\\b\\t\\n\\v\\f\\r\\\\");

  auto const s1 = "no characters to escape";
  CHECK_EQ(esc(s1), s1);
  CHECK_EQ(esc(s1, esc_style::master_file), s1);

  // RFC 1035 section 5.1
  CHECK_EQ(esc(R"(say "hi")", esc_style::master_file), R"(say \"hi\")");
  CHECK_EQ(esc("back\\slash", esc_style::master_file), R"(back\\slash)");
  CHECK_EQ(esc(std::string("\0\x7f\xff", 3), esc_style::master_file),
           R"(\000\127\255)");

  // quotes are fine in log messages
  CHECK_EQ(esc(R"("quoted")"), R"("quoted")");

  std::string out;
  CHECK(unesc(R"(say \"hi\")", out));
  CHECK_EQ(out, R"(say "hi")");
  CHECK(unesc(R"(\000\127\255)", out));
  CHECK_EQ(out, std::string("\0\x7f\xff", 3));
  CHECK(unesc(R"(a\.b)", out));
  CHECK_EQ(out, "a.b");
  CHECK(unesc("", out));
  CHECK(out.empty());

  CHECK(!unesc("trailing\\", out));
  CHECK(!unesc(R"(\25)", out));
  CHECK(!unesc(R"(\2x5)", out));
  CHECK(!unesc(R"(\256)", out));

  for (auto arg = 1; arg < argc; ++arg) {
    std::cout << esc(argv[arg], esc_style::master_file) << '\n';
  }
}
