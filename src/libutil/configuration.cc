#include "stripansi/util/configuration.hh"
#include "stripansi/util/util.hh"
#include "stripansi/util/strings.hh"

#include <vector>

namespace stripansi {

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = _settings.find(name);
    if (i == _settings.end())
        return false;
    i->second->set(value);
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, setting);
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    for (auto line : splitString<std::vector<std::string>>(contents, "\n")) {
        line = line.substr(0, line.find('#'));

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens.size() < 2 || tokens[1] != "=")
            throw UsageError("syntax error in configuration line '%1%' in '%2%'", line, path);

        /* Whitespace runs inside the value collapse to one space. */
        std::vector<std::string> words(tokens.begin() + 2, tokens.end());
        if (!set(tokens[0], concatStringsSep(" ", words)))
            warn("unknown setting '%s' in '%s'", tokens[0], path);
    }
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(trim(description))
{
}

template<>
size_t BaseSetting<size_t>::parse(const std::string & str) const
{
    try {
        return string2IntWithUnitPrefix<size_t>(str);
    } catch (UsageError &) {
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
    }
}

} // namespace stripansi
