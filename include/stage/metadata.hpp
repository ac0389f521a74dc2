#pragma once

#include <filesystem>
#include <system_error>
#include <sys/stat.h>

namespace masf::stage {

/**
 * Copies the metadata described by `st` (an lstat of `src`) onto `dst` without following
 * symlinks: ownership, extended attributes, permission bits, then access and modification
 * times. Ownership changes refused with EPERM are skipped, as are xattrs the target
 * filesystem does not support. Permission bits are not applied to symlinks.
 */
void copyMetadata(const std::filesystem::path& src, const struct stat& st,
                  const std::filesystem::path& dst, std::error_code& ec);

void copyXattrs(const std::filesystem::path& src, const std::filesystem::path& dst, std::error_code& ec);

}
