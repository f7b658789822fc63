/*

html_text_test.cpp
------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <gtest/gtest.h>
#include <mailharvest/html_text.hpp>


using std::string;
using mailharvest::html_to_text;
using mailharvest::normalize_whitespace;


TEST(html_text, tags_removed)
{
    EXPECT_EQ(html_to_text("<html><body><p>Dear <b>candidate</b>,</p><p>thank you.</p></body></html>"), "Dear candidate, thank you.");
}


TEST(html_text, block_tags_separate_words)
{
    EXPECT_EQ(html_to_text("<div>first</div><div>second</div>line<br/>break<LI>item"), "first second line break item");
}


TEST(html_text, script_and_style_removed)
{
    const string html = "<head><STYLE type=\"text/css\">\nbody { color: red; }\n</style></head>"
        "<body>visible<script>\nvar hidden = 1 < 2;\n</SCRIPT> text</body>";
    EXPECT_EQ(html_to_text(html), "visible text");
}


TEST(html_text, named_entities)
{
    EXPECT_EQ(html_to_text("Fish&nbsp;&amp;&nbsp;Chips &lt;3 &quot;quoted&quot; it&#39;s &apos;ok&apos;"), "Fish & Chips <3 \"quoted\" it's 'ok'");
    EXPECT_EQ(html_to_text("&euro;5 &pound;4 &copy;"), "\xE2\x82\xAC" "5 \xC2\xA3" "4 \xC2\xA9");
}


TEST(html_text, escaped_entity_decoded_once)
{
    EXPECT_EQ(html_to_text("&amp;nbsp;"), "&nbsp;");
}


TEST(html_text, unclosed_script_kept_in_large_document)
{
    string html = "<p>Thank you for applying.</p><script>var x = 1;";
    for (int i = 0; i < 20000; i++)
        html += "<span>row " + std::to_string(i) + "</span>\n";

    string text;
    ASSERT_NO_THROW(text = html_to_text(html));
    EXPECT_EQ(text.substr(0, 44), "Thank you for applying.var x = 1;row 0 row 1");
    EXPECT_EQ(text.substr(text.size() - 10), " row 19999");
}


TEST(html_text, escaped_angle_brackets_in_large_document)
{
    string html;
    string expected;
    for (int i = 0; i < 6000; i++)
    {
        html += "if a &lt; b then ";
        expected += "if a < b then ";
    }
    expected.pop_back();

    string text;
    ASSERT_NO_THROW(text = html_to_text(html));
    EXPECT_EQ(text, expected);
}


TEST(html_text, unclosed_element_and_bare_angle_bracket)
{
    EXPECT_EQ(html_to_text("a <b>bold</b> and 1 < 2"), "a bold and 1 < 2");
    EXPECT_EQ(html_to_text("<script>x</script>shown <style>p {}"), "shown p {}");
    EXPECT_EQ(html_to_text("<pre>one</pre><H2>two</H2>"), "one two");
}


TEST(html_text, numeric_references)
{
    EXPECT_EQ(html_to_text("caf&#233; &#8364;"), "caf\xC3\xA9 \xE2\x82\xAC");
    EXPECT_EQ(html_to_text("bad&#0;ref"), "bad&#0;ref");
    EXPECT_EQ(html_to_text("big&#99999999999999999999;ref"), "big&#99999999999999999999;ref");
}


TEST(html_text, idempotent_on_plain_text)
{
    const string plain = "We are pleased to invite you to an interview on Monday.";
    EXPECT_EQ(html_to_text(plain), plain);
    EXPECT_EQ(html_to_text(html_to_text(plain)), plain);
}


TEST(html_text, empty)
{
    EXPECT_EQ(html_to_text(""), "");
    EXPECT_EQ(html_to_text("<html><body></body></html>"), "");
}


TEST(normalize_whitespace, collapses_and_trims)
{
    EXPECT_EQ(normalize_whitespace("  a \t\r\n b\n\n c  "), "a b c");
    EXPECT_EQ(normalize_whitespace(""), "");
    EXPECT_EQ(normalize_whitespace(" \n\t "), "");
}


TEST(normalize_whitespace, unicode_spaces)
{
    EXPECT_EQ(normalize_whitespace("a\xC2\xA0\xC2\xA0" "b\xE2\x80\x83" "c\xE3\x80\x80" "d\xE2\x80\xA8"), "a b c d");
}


TEST(normalize_whitespace, keeps_other_characters)
{
    EXPECT_EQ(normalize_whitespace("\xC5\xBE\xC3\xA9 \xF0\x9F\x98\x80"), "\xC5\xBE\xC3\xA9 \xF0\x9F\x98\x80");
}
