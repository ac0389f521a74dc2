#include "stage/metadata.hpp"

#include <cerrno>
#include <string>
#include <string_view>
#include <vector>
#include <fcntl.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace masf::stage {

static bool unsupported(const int err) {
    return err == ENOTSUP || err == EOPNOTSUPP || err == ENODATA;
}

void copyXattrs(const std::filesystem::path& src, const std::filesystem::path& dst, std::error_code& ec) {
    ec.clear();

    ssize_t len = ::llistxattr(src.c_str(), nullptr, 0);
    if (len < 0) {
        if (!unsupported(errno)) ec.assign(errno, std::generic_category());
        return;
    }
    if (len == 0) return;

    std::vector<char> names(static_cast<size_t>(len));
    len = ::llistxattr(src.c_str(), names.data(), names.size());
    if (len < 0) {
        ec.assign(errno, std::generic_category());
        return;
    }

    for (const char* name = names.data(); name < names.data() + len; name += std::string_view(name).size() + 1) {
        const ssize_t vlen = ::lgetxattr(src.c_str(), name, nullptr, 0);
        if (vlen < 0) {
            if (unsupported(errno)) continue;
            ec.assign(errno, std::generic_category());
            return;
        }

        std::vector<char> value(static_cast<size_t>(vlen));
        if (vlen > 0 && ::lgetxattr(src.c_str(), name, value.data(), value.size()) < 0) {
            ec.assign(errno, std::generic_category());
            return;
        }

        if (::lsetxattr(dst.c_str(), name, value.data(), value.size(), 0) != 0) {
            // trusted.* and security.* need privileges we may not have
            if (unsupported(errno) || errno == EPERM) continue;
            ec.assign(errno, std::generic_category());
            return;
        }
    }
}

void copyMetadata(const std::filesystem::path& src, const struct stat& st,
                  const std::filesystem::path& dst, std::error_code& ec) {
    ec.clear();

    // chown before chmod, a successful chown may clear setuid/setgid
    if (::lchown(dst.c_str(), st.st_uid, st.st_gid) != 0 && errno != EPERM) {
        ec.assign(errno, std::generic_category());
        return;
    }

    copyXattrs(src, dst, ec);
    if (ec) return;

    if (!S_ISLNK(st.st_mode) && ::chmod(dst.c_str(), st.st_mode & 07777) != 0) {
        ec.assign(errno, std::generic_category());
        return;
    }

    const timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, dst.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        ec.assign(errno, std::generic_category());
        return;
    }
}

}
