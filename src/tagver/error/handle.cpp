#include "./handle.hpp"

#include <tagver/util/log.hpp>

#include <boost/leaf.hpp>
#include <fmt/ostream.h>

using namespace tagver;

void tagver::leaf_handle_unknown(std::string_view                            message,
                                 const boost::leaf::verbose_diagnostic_info& info) {
    tagver_log(error, message);
    tagver_log(error, "An unhandled error occurred:\n{}", fmt::streamed(info));
}
