/*

imap_test.cpp
-------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <list>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <mailharvest/imap.hpp>
#include "scripted_dialog.hpp"


using std::list;
using std::make_shared;
using std::shared_ptr;
using std::string;
using mailharvest::dialog_error;
using mailharvest::imap;
using mailharvest::imap_error;
using mailharvest::test::fake_mailbox;
using mailharvest::test::plain_message;
using mailharvest::test::scripted_dialog;


namespace
{

fake_mailbox three_messages()
{
    fake_mailbox mailbox;
    mailbox.messages.push_back(plain_message("a@example.com", "First", "one"));
    mailbox.messages.push_back(plain_message("b@example.com", "Second", "two"));
    mailbox.messages.push_back(plain_message("c@example.com", "Third", "three"));
    return mailbox;
}

} // anonymous namespace


TEST(imap, authenticate)
{
    auto dlg = make_shared<scripted_dialog>(three_messages());
    imap conn(dlg);
    EXPECT_EQ(conn.authenticate("user@example.com", "pa\"ss"), "[CAPABILITY IMAP4rev1] Fake server ready");
    ASSERT_EQ(dlg->sent().size(), 1U);
    EXPECT_EQ(dlg->sent()[0], "1 LOGIN \"user@example.com\" \"pa\\\"ss\"");
    ASSERT_EQ(dlg->redacted().size(), 1U);
    EXPECT_EQ(dlg->redacted()[0], dlg->sent()[0]);
}


TEST(imap, authentication_refused)
{
    fake_mailbox mailbox = three_messages();
    mailbox.refuse_login = true;
    imap conn(make_shared<scripted_dialog>(mailbox));
    try
    {
        conn.authenticate("user@example.com", "wrong");
        FAIL() << "Login was not refused.";
    }
    catch (const imap_error& exc)
    {
        EXPECT_STREQ(exc.what(), "Authentication failure.");
        EXPECT_NE(exc.details().find("AUTHENTICATIONFAILED"), string::npos);
    }
}


TEST(imap, connection_lost)
{
    fake_mailbox mailbox = three_messages();
    mailbox.drop_after_greeting = true;
    imap conn(make_shared<scripted_dialog>(mailbox));
    EXPECT_THROW(conn.authenticate("user@example.com", "secret"), dialog_error);
}


TEST(imap, select)
{
    auto dlg = make_shared<scripted_dialog>(three_messages());
    imap conn(dlg);
    conn.authenticate("user@example.com", "secret");
    imap::mailbox_stat_t stat = conn.select("INBOX");
    EXPECT_EQ(stat.messages_no, 3UL);
    EXPECT_EQ(stat.messages_recent, 0UL);
    EXPECT_EQ(stat.uid_validity, 1234UL);
    EXPECT_EQ(stat.uid_next, 4UL);
    EXPECT_EQ(dlg->sent().back(), "2 SELECT \"INBOX\"");
}


TEST(imap, select_refused)
{
    fake_mailbox mailbox = three_messages();
    mailbox.refuse_select = true;
    imap conn(make_shared<scripted_dialog>(mailbox));
    conn.authenticate("user@example.com", "secret");
    EXPECT_THROW(conn.select("INBOX"), imap_error);
}


TEST(imap, search_all)
{
    auto dlg = make_shared<scripted_dialog>(three_messages());
    imap conn(dlg);
    conn.authenticate("user@example.com", "secret");
    conn.select("INBOX");
    list<unsigned long> ids;
    conn.search("ALL", ids);
    EXPECT_EQ(ids, (list<unsigned long>{1, 2, 3}));
    EXPECT_EQ(dlg->sent().back(), "3 SEARCH ALL");
}


TEST(imap, search_empty_mailbox)
{
    imap conn(make_shared<scripted_dialog>(fake_mailbox()));
    conn.authenticate("user@example.com", "secret");
    conn.select("INBOX");
    list<unsigned long> ids;
    conn.search("ALL", ids);
    EXPECT_TRUE(ids.empty());
}


TEST(imap, fetch_keeps_message_bytes)
{
    fake_mailbox mailbox = three_messages();
    mailbox.messages[1] = "Subject: raw\r\n\r\nline (one)\r\n{5}\r\nline \"two\"\n";
    auto dlg = make_shared<scripted_dialog>(mailbox);
    imap conn(dlg);
    conn.authenticate("user@example.com", "secret");
    conn.select("INBOX");
    EXPECT_EQ(conn.fetch(2), mailbox.messages[1]);
    EXPECT_EQ(dlg->sent().back(), "3 FETCH 2 (RFC822)");
    EXPECT_EQ(conn.fetch(3), mailbox.messages[2]);
}


TEST(imap, fetch_skips_unsolicited_responses)
{
    fake_mailbox mailbox = three_messages();
    mailbox.unsolicited = "* 4 EXISTS\r\n* 2 FETCH (FLAGS (\\Seen))\r\n";
    imap conn(make_shared<scripted_dialog>(mailbox));
    conn.authenticate("user@example.com", "secret");
    conn.select("INBOX");
    EXPECT_EQ(conn.fetch(1), mailbox.messages[0]);
}


TEST(imap, fetch_refused)
{
    fake_mailbox mailbox = three_messages();
    mailbox.refused_fetches.insert(2);
    imap conn(make_shared<scripted_dialog>(mailbox));
    conn.authenticate("user@example.com", "secret");
    conn.select("INBOX");
    try
    {
        conn.fetch(2);
        FAIL() << "Fetch was not refused.";
    }
    catch (const imap_error& exc)
    {
        EXPECT_STREQ(exc.what(), "Fetching message failure.");
    }
    // The connection stays usable after a refused fetch.
    EXPECT_EQ(conn.fetch(3), mailbox.messages[2]);
}


TEST(imap, fetch_missing_message)
{
    imap conn(make_shared<scripted_dialog>(three_messages()));
    conn.authenticate("user@example.com", "secret");
    conn.select("INBOX");
    try
    {
        conn.fetch(9);
        FAIL() << "Missing message was fetched.";
    }
    catch (const imap_error& exc)
    {
        EXPECT_STREQ(exc.what(), "No message fetched.");
    }
}


TEST(imap, close_and_logout)
{
    auto dlg = make_shared<scripted_dialog>(three_messages());
    {
        imap conn(dlg);
        conn.authenticate("user@example.com", "secret");
        conn.select("INBOX");
        conn.close();
        conn.logout();
        EXPECT_FALSE(dlg->closed());
    }
    EXPECT_TRUE(dlg->closed());
    ASSERT_EQ(dlg->sent().size(), 4U);
    EXPECT_EQ(dlg->sent()[2], "3 CLOSE");
    EXPECT_EQ(dlg->sent()[3], "4 LOGOUT");
}


TEST(imap, session_name_stored_on_dialog)
{
    auto dlg = make_shared<scripted_dialog>(three_messages());
    imap conn(dlg);
    conn.set_session_name("gmail");
    EXPECT_EQ(conn.session_name(), "gmail");
    EXPECT_EQ(dlg->session_name(), "gmail");
}
