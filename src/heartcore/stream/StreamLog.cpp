#include <heartcore/stream/StreamLog.hpp>

#include "log/TaggedLogger.hpp"

namespace HC::detail {

void logStreamTransition(std::string const& stream, std::string_view transition) {
#ifdef HC_LOG_DEBUG
    hc_log("SharedStream " + stream + ": " + std::string{transition}, "SharedStream");
#else
    (void)stream;
    (void)transition;
#endif
}

} // namespace HC::detail
