#include "./fs.hpp"

#include <tagver/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace tagver;

std::fstream tagver::open_file(path_ref fpath, std::ios::openmode mode) {
    TAGVER_E_SCOPE(e_open_file_path{fpath});
    errno = 0;
    std::fstream ret{fpath, mode};
    auto         e = errno;
    if (!ret) {
        auto ec = std::error_code{e, std::system_category()};
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     fmt::format("Failed to open file [{}]",
                                                                 fpath.string())),
                                   boost::leaf::e_errno{e},
                                   ec);
    }
    return ret;
}

void tagver::write_file(path_ref dest, std::string_view content) {
    TAGVER_E_SCOPE(e_write_file_path{dest});
    auto ofile = open_file(dest, std::ios::binary | std::ios::out | std::ios::trunc);
    errno      = 0;
    ofile.write(content.data(), static_cast<std::streamsize>(content.size()));
    auto e = errno;
    if (!ofile) {
        auto ec = std::error_code(e, std::system_category());
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     fmt::format("Failed to write to file [{}]",
                                                                 dest.string())),
                                   boost::leaf::e_errno{e},
                                   ec);
    }
}

std::string tagver::read_file(path_ref path) {
    TAGVER_E_SCOPE(e_read_file_path{path});
    auto               infile = open_file(path, std::ios::binary | std::ios::in);
    std::ostringstream out;
    out << infile.rdbuf();
    return std::move(out).str();
}

fs::path tagver::normalize_path(path_ref p) {
    auto ret = fs::absolute(p).lexically_normal();
    if (!ret.has_filename() && ret.has_parent_path() && ret != ret.root_path()) {
        ret = ret.parent_path();
    }
    return ret;
}
