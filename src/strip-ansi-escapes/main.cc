#include "stripansi/main/shared.hh"
#include "stripansi/util/file-descriptor.hh"
#include "stripansi/util/serialise.hh"
#include "stripansi/util/strip.hh"

using namespace stripansi;

int main()
{
    return handleExceptions([&]() {
        initLibMain();

        StripWriter<FdSink> writer{FdSink(getStandardOutput())};
        FdSource source(getStandardInput());

        try {
            source.drainInto(writer);
            std::move(writer).unwrap();
        } catch (Error & e) {
            throw Error("I/O error copying stdin to stdout: %s", Uncolored(e.message()));
        }
    });
}
