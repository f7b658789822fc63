/*

codec_test.cpp
--------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <gtest/gtest.h>
#include <mailharvest/codec.hpp>


using std::string;
using mailharvest::codec;


TEST(codec, decode_base64)
{
    EXPECT_EQ(codec::decode_base64("SGVsbG8sIFdvcmxkIQ=="), "Hello, World!");
    EXPECT_EQ(codec::decode_base64("SGVsbG8s\r\nIFdvcmxkIQ=="), "Hello, World!");
    EXPECT_EQ(codec::decode_base64(""), "");
}


TEST(codec, decode_base64_ignores_invalid_characters)
{
    EXPECT_EQ(codec::decode_base64("SG!Vs*bG8="), "Hello");
}


TEST(codec, decode_quoted_printable)
{
    EXPECT_EQ(codec::decode_quoted_printable("Caf=C3=A9 au lait"), "Caf\xC3\xA9 au lait");
    EXPECT_EQ(codec::decode_quoted_printable("soft=\r\nbreak"), "softbreak");
    EXPECT_EQ(codec::decode_quoted_printable("soft=\nbreak"), "softbreak");
    EXPECT_EQ(codec::decode_quoted_printable("a_b"), "a_b");
}


TEST(codec, decode_quoted_printable_keeps_malformed_escapes)
{
    EXPECT_EQ(codec::decode_quoted_printable("100=ZZ"), "100=ZZ");
    EXPECT_EQ(codec::decode_quoted_printable("end="), "end=");
}


TEST(codec, decode_q_encoding)
{
    EXPECT_EQ(codec::decode_quoted_printable("Hello_World=21", true), "Hello World!");
}


TEST(codec, is_utf8_string)
{
    EXPECT_TRUE(codec::is_utf8_string("plain ascii"));
    EXPECT_TRUE(codec::is_utf8_string("\xC5\xBE\xE2\x82\xAC\xF0\x9F\x98\x80"));
    EXPECT_FALSE(codec::is_utf8_string("\xC0\xAF"));
    EXPECT_FALSE(codec::is_utf8_string("\xED\xA0\x80"));
    EXPECT_FALSE(codec::is_utf8_string("trailing \xE2\x82"));
}


TEST(codec, sanitize_utf8)
{
    const string replacement = codec::REPLACEMENT_CHARACTER;
    EXPECT_EQ(codec::sanitize_utf8("ok \xC5\xBE"), "ok \xC5\xBE");
    EXPECT_EQ(codec::sanitize_utf8("a\xFF" "b"), "a" + replacement + "b");
    EXPECT_EQ(codec::sanitize_utf8("a\xE2\x82" "b"), "a" + replacement + "b");
}


TEST(codec, to_utf8_converts_latin1)
{
    EXPECT_EQ(codec::to_utf8("caf\xE9", "ISO-8859-1"), "caf\xC3\xA9");
}


TEST(codec, to_utf8_passes_utf8_through)
{
    EXPECT_EQ(codec::to_utf8("\xC5\xBE", "UTF-8"), "\xC5\xBE");
    EXPECT_EQ(codec::to_utf8("\xC5\xBE", ""), "\xC5\xBE");
}


TEST(codec, to_utf8_unknown_charset_falls_back)
{
    EXPECT_EQ(codec::to_utf8("plain", "x-no-such-charset"), "plain");
    EXPECT_TRUE(codec::is_utf8_string(codec::to_utf8("bad \xFF byte", "x-no-such-charset")));
}


TEST(codec, encode_utf8)
{
    EXPECT_EQ(codec::encode_utf8(0x41), "A");
    EXPECT_EQ(codec::encode_utf8(0xA0), "\xC2\xA0");
    EXPECT_EQ(codec::encode_utf8(0x20AC), "\xE2\x82\xAC");
    EXPECT_EQ(codec::encode_utf8(0x1F600), "\xF0\x9F\x98\x80");
    EXPECT_EQ(codec::encode_utf8(0xD800), "");
    EXPECT_EQ(codec::encode_utf8(0x110000), "");
}


TEST(codec, escape_and_surround)
{
    EXPECT_EQ(codec::surround_string(codec::escape_string("a\"b\\c", "\"\\")), "\"a\\\"b\\\\c\"");
}
