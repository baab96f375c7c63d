#pragma once

#include <plog/Record.h>
#include <plog/Severity.h>
#include <plog/Util.h>

// Formatter for the stderr console log.
// Warnings and errors are printed as bare lines, the way a command-line filter
// reports problems; info and debug records carry their severity.
struct ConsoleFormatter
{
    static plog::util::nstring header()
    {
        return plog::util::nstring();
    }

    static plog::util::nstring format(const plog::Record& record)
    {
        plog::util::nostringstream ss;
        if (record.getSeverity() > plog::warning)
        {
            ss << PLOG_NSTR("[") << plog::severityToString(record.getSeverity()) << PLOG_NSTR("] ");
        }
        ss << record.getMessage() << PLOG_NSTR("\n");
        return ss.str();
    }
};
