/*

harvest_service.hpp
-------------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <cstddef>
#include "config.hpp"
#include "export.hpp"
#include "json_exporter.hpp"
#include "mail_session.hpp"


namespace mailharvest
{


/**
Running a harvest: connecting, fetching the records and exporting them.
**/
class MAILHARVEST_EXPORT harvest_service
{
public:

    /**
    Storing the collaborators, which must outlive the service.

    @param session  Session of the harvested account.
    @param exporter Writer of the records.
    **/
    harvest_service(mail_session& session, const json_exporter& exporter);

    harvest_service(const harvest_service&) = delete;

    harvest_service(harvest_service&&) = delete;

    ~harvest_service() = default;

    void operator=(const harvest_service&) = delete;

    void operator=(harvest_service&&) = delete;

    /**
    Exporting the inbox of the session into the output file.

    The session is disconnected on every path, also when the export fails.

    @param options       Run parameters.
    @return              Number of exported records.
    @throw harvest_error Connection, mailbox or export failure.
    **/
    std::size_t run(const harvest_options& options);

private:

    mail_session& session_;

    const json_exporter& exporter_;
};


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
