#include "./temp.hpp"

#include <tagver/util/log.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>

#include <cerrno>
#include <stdlib.h>
#include <system_error>

using namespace tagver;

namespace {

struct remove_directory {
    void operator()(const fs::path* p) const noexcept {
        std::error_code ec;
        fs::remove_all(*p, ec);
        if (ec) {
            tagver_log(warn,
                       "Failed to remove temporary directory [{}]: {}",
                       p->string(),
                       ec.message());
        }
        delete p;
    }
};

}  // namespace

temporary_dir::temporary_dir(fs::path p)
    : _path(new fs::path(std::move(p)), remove_directory{}) {}

temporary_dir temporary_dir::create() {
    auto tmpl = (fs::temp_directory_path() / "tagver-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        auto e = errno;
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(std::error_code(e, std::system_category()),
                                                     "Failed to create a temporary directory"),
                                   boost::leaf::e_errno{e});
    }
    return temporary_dir(fs::path(tmpl));
}
