#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/logging.hh"

#include <cassert>
#include <sstream>

namespace buildjail {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace { .hint = hint });
    what_.reset();
}

const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err);
        what_ = oss.str();
        return *what_;
    }
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    std::string prefix;
    switch (einfo.level) {
        case Verbosity::lvlError: {
            prefix = ANSI_RED "error";
            break;
        }
        case Verbosity::lvlNotice: {
            prefix = ANSI_RED "note";
            break;
        }
        case Verbosity::lvlWarn: {
            prefix = ANSI_WARNING "warning";
            break;
        }
        case Verbosity::lvlInfo: {
            prefix = ANSI_GREEN "info";
            break;
        }
        case Verbosity::lvlTalkative: {
            prefix = ANSI_GREEN "talk";
            break;
        }
        case Verbosity::lvlChatty: {
            prefix = ANSI_GREEN "chat";
            break;
        }
        case Verbosity::lvlVomit: {
            prefix = ANSI_GREEN "vomit";
            break;
        }
        case Verbosity::lvlDebug: {
            prefix = ANSI_WARNING "debug";
            break;
        }
        default:
            assert(false);
    }

    out << prefix << ":" << ANSI_NORMAL << " ";

    /* Traces are printed outermost first, so the most specific context
       ends up right above the message itself. */
    for (auto & trace : einfo.traces) {
        out << "\n       … " << trace.hint.str();
    }
    if (!einfo.traces.empty())
        out << "\n\n       ";

    out << einfo.msg.str();

    return out;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    /* Make sure no exceptions leave this function.
       printError() also throws when remote is closed. */
    try {
        try {
            throw;
        } catch (std::exception & e) {
            printMsg(lvl, "error (ignored): %1%", Uncolored(e.what()));
        }
    } catch (...) { }
}

}
