#include "sink.hh"
#include "macros.hh"

bool
chunked::finalize_sink(std::unique_ptr<chunked::Sink>&& sink)
{
    if (sink == nullptr) {
        LOG_DEBUG("Sink is null. Nothing to finalize.");
        return true;
    }

    const bool flushed = sink->flush_();
    sink.reset();

    return flushed;
}
