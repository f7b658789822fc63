/*

header_decoder_test.cpp
-----------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <gtest/gtest.h>
#include <mailharvest/header_decoder.hpp>


using std::string;
using mailharvest::decode_header;


TEST(header_decoder, plain_ascii_unchanged)
{
    EXPECT_EQ(decode_header("Interview invitation for the Backend role"), "Interview invitation for the Backend role");
    EXPECT_EQ(decode_header("  spaced  out  "), "  spaced  out  ");
    EXPECT_EQ(decode_header("Jane Doe <jane@example.com>"), "Jane Doe <jane@example.com>");
}


TEST(header_decoder, empty)
{
    EXPECT_EQ(decode_header(""), "");
}


TEST(header_decoder, base64_word)
{
    EXPECT_EQ(decode_header("=?UTF-8?B?SGVsbG8gV29ybGQ=?="), "Hello World");
}


TEST(header_decoder, q_word)
{
    EXPECT_EQ(decode_header("=?utf-8?Q?Caf=C3=A9_au_lait?="), "Caf\xC3\xA9 au lait");
}


TEST(header_decoder, latin1_word)
{
    EXPECT_EQ(decode_header("=?ISO-8859-1?Q?Andr=E9?="), "Andr\xC3\xA9");
}


TEST(header_decoder, mixed_plain_and_encoded)
{
    EXPECT_EQ(decode_header("Re: =?utf-8?Q?Caf=C3=A9?= order"), "Re: Caf\xC3\xA9 order");
    EXPECT_EQ(decode_header("=?utf-8?B?Sm9obg==?= <john@example.com>"), "John <john@example.com>");
}


TEST(header_decoder, adjacent_words_are_joined)
{
    // Whitespace between encoded words is not part of the text.
    EXPECT_EQ(decode_header("=?utf-8?Q?Hello?= =?utf-8?Q?World?="), "HelloWorld");
    EXPECT_EQ(decode_header("=?utf-8?Q?Hello_?=\r\n =?utf-8?Q?World?="), "Hello World");
}


TEST(header_decoder, multibyte_character_split_across_words)
{
    EXPECT_EQ(decode_header("=?utf-8?B?w4=?= =?utf-8?B?qQ==?="), decode_header("=?utf-8?Q?=C3?= =?utf-8?Q?=A9?="));
    EXPECT_EQ(decode_header("=?utf-8?Q?=C3?= =?utf-8?Q?=A9?="), "\xC3\xA9");
}


TEST(header_decoder, language_suffix_ignored)
{
    EXPECT_EQ(decode_header("=?utf-8*en?Q?Offer?="), "Offer");
}


TEST(header_decoder, unknown_charset_gives_valid_utf8)
{
    EXPECT_EQ(decode_header("=?x-unknown?Q?plain?="), "plain");
}


TEST(header_decoder, malformed_word_left_as_is)
{
    EXPECT_EQ(decode_header("=?utf-8?X?abc?="), "=?utf-8?X?abc?=");
}
