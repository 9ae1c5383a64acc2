#include "core/Logging.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/make_shared.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <unistd.h>
#include <iostream>

namespace tas {

namespace logging = boost::log;
namespace sinks = boost::log::sinks;

namespace {

constexpr const char* kRed = "\033[0;31m";
constexpr const char* kYellow = "\033[1;33m";
constexpr const char* kDim = "\033[2m";
constexpr const char* kReset = "\033[0m";

void formatRecord(bool colour, const logging::record_view& rec, logging::formatting_ostream& strm)
{
    auto severity = logging::extract<logging::trivial::severity_level>("Severity", rec);
    auto message = rec[logging::expressions::smessage];

    const char* prefix = "";
    const char* colourCode = nullptr;
    if (severity) {
        switch (*severity) {
        case logging::trivial::trace:
        case logging::trivial::debug:
            prefix = "  ";
            colourCode = kDim;
            break;
        case logging::trivial::warning:
            prefix = "Warning: ";
            colourCode = kYellow;
            break;
        case logging::trivial::error:
        case logging::trivial::fatal:
            prefix = "Error: ";
            colourCode = kRed;
            break;
        default:
            break;
        }
    }

    if (colour && colourCode)
        strm << colourCode;
    strm << prefix << message;
    if (colour && colourCode)
        strm << kReset;
}

} // namespace

logging::trivial::severity_level parseSeverity(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "trace") return logging::trivial::trace;
    if (n == "debug") return logging::trivial::debug;
    if (n == "warning" || n == "warn") return logging::trivial::warning;
    if (n == "error") return logging::trivial::error;
    if (n == "fatal") return logging::trivial::fatal;
    return logging::trivial::info;
}

void initLogging(logging::trivial::severity_level threshold)
{
    using Backend = sinks::text_ostream_backend;
    using Sink = sinks::synchronous_sink<Backend>;

    auto backend = boost::make_shared<Backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::cout, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<Sink>(backend);
    const bool colour = ::isatty(STDOUT_FILENO) == 1;
    sink->set_formatter([colour](const logging::record_view& rec, logging::formatting_ostream& strm) {
        formatRecord(colour, rec, strm);
    });

    auto core = logging::core::get();
    core->remove_all_sinks();
    core->add_sink(sink);
    core->set_filter(logging::trivial::severity >= threshold);
}

} // namespace tas
