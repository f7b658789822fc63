/*

mail_session.cpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <list>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <mailharvest/content_extractor.hpp>
#include <mailharvest/date_normalizer.hpp>
#include <mailharvest/header_decoder.hpp>
#include <mailharvest/log.hpp>
#include <mailharvest/mail_session.hpp>
#include <mailharvest/mime.hpp>


using std::list;
using std::make_unique;
using std::move;
using std::optional;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::unique_ptr;
using std::vector;


namespace mailharvest
{


const string mail_session::INBOX{"INBOX"};


shared_ptr<dialog> mail_session::open_ssl_dialog(const string& hostname, unsigned port)
{
    return dialog_ssl::open(hostname, port);
}


mail_session::mail_session(const provider_profile& profile, credentials_t credentials, dialog_factory_t factory) : profile_(profile),
    credentials_(move(credentials)), dialog_factory_(move(factory)), mailbox_selected_(false)
{
}


mail_session::~mail_session()
{
    disconnect();
}


void mail_session::connect()
{
    if (imap_)
        return;

    logger()->info("Connecting to {}:{}...", profile_.host, profile_.port);
    try
    {
        auto client = make_unique<imap>(dialog_factory_(profile_.host, profile_.port));
        client->set_session_name(profile_.name);
        client->authenticate(credentials_.username, credentials_.secret);
        imap_ = move(client);
    }
    catch (const dialog_error& exc)
    {
        throw connection_error("Connection to " + profile_.host + " failed: " + exc.what(), exc.details());
    }
    logger()->debug("Logged in to {}.", profile_.host);
}


bool mail_session::is_connected() const
{
    return imap_ != nullptr;
}


vector<email_record> mail_session::fetch_all(optional<long> limit, bool plain_text_only, const exclusion_list_t& exclusions)
{
    if (!imap_)
        throw connection_error("Not connected.", "The session must be connected before fetching.");

    list<unsigned long> message_ids;
    try
    {
        imap_->select(INBOX);
        mailbox_selected_ = true;
        imap_->search("ALL", message_ids);
    }
    catch (const imap_error& exc)
    {
        throw mailbox_error(string("Error reading the inbox: ") + exc.what(), exc.details());
    }
    catch (const dialog_error& exc)
    {
        throw connection_error(string("Connection lost: ") + exc.what(), exc.details());
    }

    vector<email_record> records;
    if (message_ids.empty())
    {
        logger()->info("No messages found.");
        return records;
    }

    if (limit.has_value() && limit.value() > 0)
        while (message_ids.size() > static_cast<unsigned long>(limit.value()))
            message_ids.pop_front();

    const std::size_t total = message_ids.size();
    std::size_t current = 0;
    for (auto message_no : message_ids)
    {
        logger()->debug("Processing message {}/{}", ++current, total);
        try
        {
            optional<email_record> record = harvest_message(message_no, plain_text_only, exclusions);
            if (record.has_value())
                records.push_back(move(record.value()));
        }
        catch (const fetch_error& exc)
        {
            logger()->warn("{} {}", exc.what(), exc.details());
        }
        catch (const decode_error& exc)
        {
            logger()->warn("{} {}", exc.what(), exc.details());
        }
    }
    logger()->info("Processed {} messages, {} records.", total, records.size());
    return records;
}


void mail_session::disconnect()
{
    if (!imap_)
        return;

    if (mailbox_selected_)
    {
        try
        {
            imap_->close();
        }
        catch (const dialog_error& exc)
        {
            logger()->debug("Closing the mailbox failed: {} {}", exc.what(), exc.details());
        }
    }
    try
    {
        imap_->logout();
    }
    catch (const dialog_error& exc)
    {
        logger()->debug("Logout failed: {} {}", exc.what(), exc.details());
    }

    imap_.reset();
    mailbox_selected_ = false;
    logger()->debug("Disconnected from {}.", profile_.host);
}


const provider_profile& mail_session::profile() const
{
    return profile_;
}


optional<email_record> mail_session::harvest_message(unsigned long message_no, bool plain_text_only, const exclusion_list_t& exclusions)
{
    const string id = to_string(message_no);
    string raw;
    try
    {
        raw = imap_->fetch(message_no);
    }
    catch (const imap_error& exc)
    {
        throw fetch_error("Error fetching message " + id + ": " + exc.what(), exc.details());
    }
    catch (const dialog_error& exc)
    {
        throw connection_error("Connection lost while fetching message " + id + ": " + exc.what(), exc.details());
    }

    mime message;
    try
    {
        message.parse(raw);
    }
    catch (const mime_error& exc)
    {
        throw decode_error("Error parsing message " + id + ": " + exc.what(), exc.details());
    }

    email_record record;
    record.id = id;
    record.from = decode_header(message.header("From"));
    if (is_excluded(record.from, exclusions))
    {
        logger()->debug("Skipping message {} from excluded sender {}.", id, record.from);
        return std::nullopt;
    }
    record.subject = decode_header(message.header("Subject"));
    record.date = normalize_date(message.header("Date"));

    record.content = extract_content(message, plain_text_only);
    return record;
}


unique_ptr<mail_session> make_session(provider_t provider, const credentials_t& credentials)
{
    return make_unique<mail_session>(provider_profile_for(provider), credentials);
}


} // namespace mailharvest
