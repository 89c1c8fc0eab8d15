#pragma once

#include <string_view>

namespace boost::leaf {

class verbose_diagnostic_info;

}  // namespace boost::leaf

namespace tagver {

/**
 * @brief Log a message and the full diagnostic information of an error that no other handler
 * recognized.
 */
void leaf_handle_unknown(std::string_view message, const boost::leaf::verbose_diagnostic_info&);

}  // namespace tagver
