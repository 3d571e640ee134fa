#pragma once
///@file

#include <map>
#include <string>

namespace stripansi {

class AbstractSetting;

/**
 * A set of named settings. Each `Setting` registers itself with the
 * `Config` it is a member of:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<size_t> foo{this, 123, "foo", "the number of foos to use"};
 *   };
 */
class Config
{
    std::map<std::string, AbstractSetting *> _settings;

public:

    Config() = default;
    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    virtual ~Config() = default;

    /**
     * Parse `value` into the setting called `name`.
     *
     * @return false if there is no such setting.
     */
    bool set(const std::string & name, const std::string & value);

    void addSetting(AbstractSetting * setting);

    /**
     * Apply `name = value` lines. `#` starts a comment; an unknown name
     * is warned about and skipped. `path` is only used in messages.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;

protected:

    AbstractSetting(const std::string & name, const std::string & description);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & value) = 0;
};

template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;

    /**
     * Throws `UsageError` if `str` is not a valid `T`.
     */
    T parse(const std::string & str) const;

public:

    BaseSetting(const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    void set(const std::string & str) override final
    {
        value = parse(str);
    }
};

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * options, const T & def, const std::string & name, const std::string & description)
        : BaseSetting<T>(def, name, description)
    {
        options->addSetting(this);
    }

    void operator=(const T & v)
    {
        this->value = v;
    }
};

template<>
size_t BaseSetting<size_t>::parse(const std::string & str) const;

} // namespace stripansi
