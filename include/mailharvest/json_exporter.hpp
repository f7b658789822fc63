/*

json_exporter.hpp
-----------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <vector>
#include "email_record.hpp"
#include "export.hpp"
#include "harvest_error.hpp"


namespace mailharvest
{


/**
Writing the records as a single JSON array.
**/
class MAILHARVEST_EXPORT json_exporter
{
public:

    /**
    Number of spaces of an indentation level.
    **/
    static const int INDENTATION = 2;

    /**
    Formatting the records as JSON text.

    Each record is an object with the keys `id`, `subject`, `from`, `date` and `content`, in that order. Non-ASCII characters are written as
    they are, invalid UTF-8 sequences are replaced.

    @param records Records to format.
    @return        Indented JSON array.
    **/
    static std::string to_json(const std::vector<email_record>& records);

    /**
    Writing the records into the file, replacing its content.

    @param records      Records to write.
    @param path         Path of the file.
    @throw export_error File cannot be opened or written.
    **/
    void write(const std::vector<email_record>& records, const std::string& path) const;
};


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
