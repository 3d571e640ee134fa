#include "stripansi/util/file-descriptor.hh"

#include <cerrno>

namespace stripansi {

void writeFull(Descriptor fd, std::string_view s)
{
    while (!s.empty()) {
        ssize_t res = ::write(fd, s.data(), s.size());
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file");
        }
        s.remove_prefix(res);
    }
}

} // namespace stripansi
