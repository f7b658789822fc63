/*

mail_session.hpp
----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "dialog.hpp"
#include "email_record.hpp"
#include "exclusions.hpp"
#include "export.hpp"
#include "harvest_error.hpp"
#include "imap.hpp"
#include "provider.hpp"


namespace mailharvest
{


/**
Creating a connected dialog to the given server.
**/
typedef std::function<std::shared_ptr<dialog>(const std::string& hostname, unsigned port)> dialog_factory_t;


/**
Connection to the inbox of a single account, turning its messages into records.

The session is either disconnected or connected. It owns the IMAP connection exclusively and releases it on disconnect and on destruction.
**/
class MAILHARVEST_EXPORT mail_session
{
public:

    /**
    Name of the harvested mailbox.
    **/
    static const std::string INBOX;

    /**
    Dialog factory opening the implicit TLS connection.
    **/
    static std::shared_ptr<dialog> open_ssl_dialog(const std::string& hostname, unsigned port);

    /**
    Creating a disconnected session.

    @param profile     Provider endpoint.
    @param credentials Account credentials.
    @param factory     Dialog factory, the implicit TLS one by default.
    **/
    mail_session(const provider_profile& profile, credentials_t credentials, dialog_factory_t factory = open_ssl_dialog);

    /**
    Disconnecting if connected.
    **/
    ~mail_session();

    mail_session(const mail_session&) = delete;

    mail_session(mail_session&&) = delete;

    void operator=(const mail_session&) = delete;

    void operator=(mail_session&&) = delete;

    /**
    Connecting and logging in, nothing is done if already connected.

    @throw connection_error Transport or authentication failure, the session stays disconnected.
    **/
    void connect();

    /**
    Checking whether the session is connected.
    **/
    bool is_connected() const;

    /**
    Fetching the inbox messages as records, in the server order.

    Messages which cannot be fetched or parsed are logged and skipped.

    @param limit            Number of the most recent messages to process, all of them if missing or not positive.
    @param plain_text_only  Flag whether the HTML parts are ignored.
    @param exclusions       Sender substrings to skip.
    @return                 Records of the processed messages.
    @throw connection_error Session not connected or connection lost.
    @throw mailbox_error    Inbox selection or search refused.
    **/
    std::vector<email_record> fetch_all(std::optional<long> limit, bool plain_text_only, const exclusion_list_t& exclusions);

    /**
    Closing the mailbox and logging out, failures are logged and ignored.
    **/
    void disconnect();

    /**
    Provider endpoint.
    **/
    const provider_profile& profile() const;

protected:

    /**
    Fetching a message and turning it into a record.

    @param message_no       Sequence number of the message.
    @param plain_text_only  Flag whether the HTML parts are ignored.
    @param exclusions       Sender substrings to skip.
    @return                 Record, none if the sender is excluded.
    @throw fetch_error      Server refused the message.
    @throw decode_error     Message cannot be parsed.
    @throw connection_error Connection lost.
    **/
    std::optional<email_record> harvest_message(unsigned long message_no, bool plain_text_only, const exclusion_list_t& exclusions);

    /**
    Provider endpoint.
    **/
    const provider_profile profile_;

    /**
    Account credentials.
    **/
    const credentials_t credentials_;

    /**
    Dialog factory.
    **/
    dialog_factory_t dialog_factory_;

    /**
    IMAP client, set while connected.
    **/
    std::unique_ptr<imap> imap_;

    /**
    Flag whether the inbox is selected, so it has to be closed.
    **/
    bool mailbox_selected_;
};


/**
Creating the session of the provider.

@param provider    Mail provider.
@param credentials Account credentials.
@return            Disconnected session.
**/
MAILHARVEST_EXPORT std::unique_ptr<mail_session> make_session(provider_t provider, const credentials_t& credentials);


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
