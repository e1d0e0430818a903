#include "IDNA.hpp"

#include <gflags/gflags.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  static_assert(IDNA::is_ascii("www.example.com"));
  static_assert(IDNA::is_ascii(""));
  static_assert(!IDNA::is_ascii("黒川.日本"));

  CHECK_EQ(IDNA::to_ascii("黒川.日本"), "xn--5rtw95l.xn--wgv71a");
  CHECK_EQ(IDNA::to_ascii("黒川.日本."), "xn--5rtw95l.xn--wgv71a");
  CHECK_EQ(IDNA::to_unicode("xn--5rtw95l.xn--wgv71a"), "黒川.日本");
  CHECK_EQ(IDNA::to_unicode("xn--5rtw95l.xn--wgv71a."), "黒川.日本");

  // ASCII is folded to lower case on the way out, and left alone on
  // the way back.
  CHECK_EQ(IDNA::to_ascii("WWW.Example.COM"), "www.example.com");
  CHECK_EQ(IDNA::to_unicode("www.example.com"), "www.example.com");

  CHECK_EQ(IDNA::to_ascii(""), "");
  CHECK_EQ(IDNA::to_ascii("."), "");
  CHECK_EQ(IDNA::to_unicode(""), "");

  // non-ascii "dot" before "com"
  CHECK_EQ(IDNA::nfkc("hi⒌com"), "hi5.com");
  CHECK_EQ(IDNA::to_ascii("hi⒌com"), "hi5.com");
  CHECK_EQ(IDNA::nfkc("ｅｘａｍｐｌｅ"), "example");
  CHECK_EQ(IDNA::nfkc(""), "");
}
