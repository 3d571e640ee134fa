#include "stripansi/util/strip.hh"
#include "stripansi/util/util.hh"

namespace stripansi {

StripSettings stripSettings;

/**
 * Append the UTF-8 encoding of `c` to `out`.
 */
static void encodeUtf8(char32_t c, std::string & out)
{
    if (c < 0x80)
        out.push_back(static_cast<char>(c));
    else if (c < 0x800) {
        out.push_back(static_cast<char>(0xc0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3f)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xe0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3f)));
    } else {
        out.push_back(static_cast<char>(0xf0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3f)));
    }
}

void StripPerformer::perform(Sink & out, const terminal::Token & token)
{
    std::visit(
        overloaded{
            [&](const terminal::Print & p) {
                std::string s;
                encodeUtf8(p.c, s);
                forward(out, s);
            },
            [&](const terminal::Execute & e) {
                if (e.byte == '\n')
                    forward(out, "\n");
            },
            [](const auto &) {},
        },
        token);
}

void StripPerformer::forward(Sink & out, std::string_view data)
{
    try {
        out(data);
    } catch (...) {
        err = std::current_exception();
    }
}

std::string strip(std::string_view data)
{
    StripWriter<StringSink> writer{StringSink(data.size())};
    writer.write(data);
    return std::move(writer).unwrap().s;
}

} // namespace stripansi
