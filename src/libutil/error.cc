#include "stripansi/util/error.hh"

#include <sstream>

namespace stripansi {

const char * BaseError::what() const noexcept
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err);
        what_ = oss.str();
    }
    return what_->c_str();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    const char * prefix = "";
    switch (einfo.level) {
    case lvlError:
        prefix = ANSI_RED "error";
        break;
    case lvlWarn:
        prefix = ANSI_WARNING "warning";
        break;
    case lvlInfo:
        prefix = ANSI_GREEN "info";
        break;
    case lvlDebug:
        prefix = ANSI_WARNING "debug";
        break;
    }
    return out << prefix << ":" ANSI_NORMAL " " << einfo.msg.str();
}

} // namespace stripansi
