/*

mime_test.cpp
-------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iterator>
#include <string>
#include <gtest/gtest.h>
#include <mailharvest/mime.hpp>


using std::string;
using mailharvest::mime;
using mailharvest::mime_error;


TEST(mime, headers_case_insensitive)
{
    mime msg;
    msg.parse("From: Jane <jane@example.com>\r\nSUBJECT: Hello\r\nX-Empty:\r\n\r\nbody\r\n");
    EXPECT_EQ(msg.header("from"), "Jane <jane@example.com>");
    EXPECT_EQ(msg.header("Subject"), "Hello");
    EXPECT_TRUE(msg.has_header("x-empty"));
    EXPECT_EQ(msg.header("X-Empty"), "");
    EXPECT_FALSE(msg.has_header("Date"));
    EXPECT_EQ(msg.header("Date"), "");
}


TEST(mime, repeated_headers_kept_in_order)
{
    mime msg;
    msg.parse("Received: from relay2\r\nSubject: Hi\r\nreceived: from relay1\r\n\r\nbody");
    EXPECT_EQ(msg.headers().size(), 3U);
    EXPECT_EQ(msg.headers().count("RECEIVED"), 2U);
    auto received = msg.headers().equal_range("Received");
    EXPECT_EQ(received.first->second, "from relay2");
    EXPECT_EQ(std::next(received.first)->second, "from relay1");
    EXPECT_EQ(msg.header("Received"), "from relay2");
}


TEST(mime, folded_header)
{
    mime msg;
    msg.parse("Subject: a very\r\n long\r\n\tsubject\r\n\r\nbody");
    EXPECT_EQ(msg.header("Subject"), "a very long\tsubject");
}


TEST(mime, plain_body_lf_endings)
{
    mime msg;
    msg.parse("Content-Type: text/plain; charset=\"ISO-8859-1\"\nContent-Transfer-Encoding: 8bit\n\nline one\nline two\n");
    EXPECT_EQ(msg.content_type().media_type(), "text/plain");
    EXPECT_EQ(msg.content_type().charset(), "ISO-8859-1");
    EXPECT_EQ(msg.encoding(), mime::content_transfer_encoding_t::BIT_8);
    EXPECT_FALSE(msg.is_multipart());
    EXPECT_EQ(msg.content(), "line one\nline two");
}


TEST(mime, base64_body)
{
    mime msg;
    msg.parse("Content-Type: text/plain; charset=utf-8\r\nContent-Transfer-Encoding: BASE64\r\n\r\nSGVsbG8s\r\nIFdvcmxkIQ==\r\n");
    EXPECT_EQ(msg.encoding(), mime::content_transfer_encoding_t::BASE_64);
    EXPECT_EQ(msg.decoded_content(), "Hello, World!");
    EXPECT_EQ(msg.text_content(), "Hello, World!");
}


TEST(mime, quoted_printable_latin1_body)
{
    mime msg;
    msg.parse("Content-Type: text/plain; charset=iso-8859-1\r\nContent-Transfer-Encoding: quoted-printable\r\n\r\nCaf=E9 =\r\nau lait");
    EXPECT_EQ(msg.text_content(), "Caf\xC3\xA9 au lait");
}


TEST(mime, content_type_parameters)
{
    mime msg;
    msg.parse("Content-Type: Multipart/Alternative; BOUNDARY=\"b;1\"; charset=utf-8\r\n\r\n--b;1\r\n\r\npart\r\n--b;1--\r\n");
    EXPECT_EQ(msg.content_type().type, "multipart");
    EXPECT_EQ(msg.content_type().subtype, "alternative");
    EXPECT_EQ(msg.content_type().boundary(), "b;1");
    EXPECT_EQ(msg.content_type().charset(), "utf-8");
}


TEST(mime, garbled_content_type)
{
    mime msg;
    msg.parse("Content-Type: ???garbage\r\n\r\n<html>hi</html>");
    EXPECT_EQ(msg.content_type().media_type(), "");
    EXPECT_EQ(msg.content(), "<html>hi</html>");
}


TEST(mime, multipart_alternative)
{
    const string raw =
        "From: hr@example.com\r\n"
        "Content-Type: multipart/alternative; boundary=\"XYZ\"\r\n"
        "\r\n"
        "This is the preamble.\r\n"
        "--XYZ\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n"
        "\r\n"
        "Plain version\r\n"
        "--XYZ\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "\r\n"
        "<p>HTML version</p>\r\n"
        "--XYZ--\r\n"
        "Epilogue.\r\n";
    mime msg;
    msg.parse(raw);
    ASSERT_TRUE(msg.is_multipart());
    ASSERT_EQ(msg.parts().size(), 2U);
    EXPECT_EQ(msg.parts()[0].content_type().media_type(), "text/plain");
    EXPECT_EQ(msg.parts()[0].content(), "Plain version");
    EXPECT_EQ(msg.parts()[1].content_type().media_type(), "text/html");
    EXPECT_EQ(msg.parts()[1].content(), "<p>HTML version</p>");
    EXPECT_EQ(msg.decoded_content(), "");
}


TEST(mime, nested_multipart_walk_order)
{
    const string raw =
        "Content-Type: multipart/mixed; boundary=outer\r\n"
        "\r\n"
        "--outer\r\n"
        "Content-Type: multipart/alternative; boundary=inner\r\n"
        "\r\n"
        "--inner\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "text\r\n"
        "--inner\r\n"
        "Content-Type: text/html\r\n"
        "\r\n"
        "<b>text</b>\r\n"
        "--inner--\r\n"
        "--outer\r\n"
        "Content-Type: application/pdf; name=\"cv.pdf\"\r\n"
        "Content-Disposition: Attachment; filename=\"cv.pdf\"\r\n"
        "Content-Transfer-Encoding: base64\r\n"
        "\r\n"
        "JVBERi0xLjQ=\r\n"
        "--outer--\r\n";
    mime msg;
    msg.parse(raw);
    auto entities = msg.walk();
    ASSERT_EQ(entities.size(), 5U);
    EXPECT_EQ(entities[0], &msg);
    EXPECT_EQ(entities[1]->content_type().media_type(), "multipart/alternative");
    EXPECT_EQ(entities[2]->content_type().media_type(), "text/plain");
    EXPECT_EQ(entities[3]->content_type().media_type(), "text/html");
    EXPECT_EQ(entities[4]->content_type().media_type(), "application/pdf");
    EXPECT_TRUE(entities[4]->is_attachment());
    EXPECT_FALSE(entities[2]->is_attachment());
    EXPECT_EQ(entities[4]->decoded_content(), "%PDF-1.4");
}


TEST(mime, missing_close_delimiter)
{
    mime msg;
    msg.parse("Content-Type: multipart/mixed; boundary=b\r\n\r\n--b\r\nContent-Type: text/plain\r\n\r\nunterminated\r\n");
    ASSERT_EQ(msg.parts().size(), 1U);
    EXPECT_EQ(msg.parts()[0].content(), "unterminated");
}


TEST(mime, multipart_without_delimiters_keeps_body)
{
    mime msg;
    msg.parse("Content-Type: multipart/mixed; boundary=nothere\r\n\r\njust text\r\n");
    EXPECT_FALSE(msg.is_multipart());
    EXPECT_EQ(msg.content(), "just text");
}


TEST(mime, embedded_message)
{
    mime msg;
    msg.parse("Content-Type: message/rfc822\r\n\r\nSubject: inner\r\nContent-Type: text/plain\r\n\r\ninner body\r\n");
    ASSERT_EQ(msg.parts().size(), 1U);
    EXPECT_EQ(msg.parts()[0].header("Subject"), "inner");
    EXPECT_EQ(msg.parts()[0].content(), "inner body");
}


TEST(mime, body_without_blank_line)
{
    mime msg;
    msg.parse("Subject: no separator\r\nthis line is body text\r\nand this one");
    EXPECT_EQ(msg.header("Subject"), "no separator");
    EXPECT_EQ(msg.content(), "this line is body text\nand this one");
}


TEST(mime, headers_only)
{
    mime msg;
    msg.parse("Subject: nothing else\r\n");
    EXPECT_EQ(msg.header("Subject"), "nothing else");
    EXPECT_EQ(msg.content(), "");
}


TEST(mime, empty_message)
{
    mime msg;
    EXPECT_THROW(msg.parse(""), mime_error);
}
