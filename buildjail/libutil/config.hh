#pragma once
///@file

#include <cassert>
#include <map>
#include <set>

#include "buildjail/libutil/json.hh"
#include "buildjail/libutil/types.hh"

namespace buildjail {

/**
 * Options for applying `Config` settings.
 */
struct ApplyConfigOptions
{
    /**
     * The configuration file being loaded.
     *
     * If set, relative paths are allowed and interpreted as relative to the
     * directory of this path.
     */
    std::optional<Path> path = std::nullopt;

    /**
     * Display the `path` field, with a reasonable default if none is
     * available.
     */
    std::string relativeDisplay() const {
        return path ? *path : "<unknown>";
    }
};

/**
 * The Config class holds a collection of uniquely named settings.
 *
 * Each property that you can set in a configuration corresponds to a
 * `Setting`. A setting records value and description of a property
 * with a default and optional aliases. Settings register themselves
 * with the `Config` they belong to:
 *
 *   class MySettings : public Config
 *   {
 *   public:
 *     Setting<std::string> shell{this, "/bin/sh", "shell", "the shell to use"};
 *   };
 *
 * A configuration file consists of `name = value` lines. `#` starts a
 * comment, `include <file>` and `!include <file>` pull in other files,
 * and `extra-<name> = ...` appends to list-valued settings.
 */

class AbstractSetting;

class AbstractConfig
{
public:
    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

protected:
    StringMap unknownSettings;

    AbstractConfig(StringMap initials = {});

public:
    virtual ~AbstractConfig() = default;

    /**
     * Sets the value referenced by `name` to `value`. Returns true if the
     * setting is known, false otherwise.
     */
    virtual bool set(
        const std::string & name,
        const std::string & value,
        const ApplyConfigOptions & options = {}
    ) = 0;

    /**
     * Adds the currently known settings to the given result map `res`.
     * - res: map to store settings in
     * - overriddenOnly: when set to true only overridden settings will be added to `res`
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) = 0;

    /**
     * Resets the `overridden` flag of all Settings
     */
    virtual void resetOverridden() = 0;

    /**
     * Outputs all settings to JSON
     */
    virtual JSON toJSON() = 0;

    /**
     * Parses the configuration in `contents` and applies it.
     */
    void applyConfig(const std::string & contents, const ApplyConfigOptions & options = {});

    /**
     * Read and apply the configuration file at `path`, if it exists.
     */
    void applyConfigFile(const Path & path);

    /**
     * Logs a warning for each unregistered setting
     */
    void warnUnknownSettings();

    const StringMap & getUnknownSettings() const { return unknownSettings; }
};

class Config : public AbstractConfig
{
    friend class AbstractSetting;

public:

    struct SettingData
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    using Settings = std::map<std::string, SettingData>;

private:

    Settings _settings;

public:

    Config(StringMap initials = {});

    bool set(const std::string & name, const std::string & value, const ApplyConfigOptions & options = {}) override;

    void addSetting(AbstractSetting * setting);

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) override;

    void resetOverridden() override;

    JSON toJSON() override;

    /**
     * Outputs all settings in a key-value pair format suitable to be
     * used as a configuration file.
     */
    std::string toKeyValue(bool overriddenOnly = false);
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    bool overridden = false;

protected:

    AbstractSetting(
        const std::string & name,
        const std::string & description,
        const StringSet & aliases);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & value, bool append = false, const ApplyConfigOptions & options = {}) = 0;

    /**
     * Whether the type is appendable; i.e. whether the `append`
     * parameter to `set()` is allowed to be `true`.
     */
    virtual bool isAppendable() = 0;

    virtual std::string to_string() const = 0;

    JSON toJSON();

    virtual std::map<std::string, JSON> toJSONObject() const;

public:
    bool isOverridden() const;
};

/**
 * A setting of type T.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;
    const T defaultValue;

    /**
     * Parse the string into a `T`.
     *
     * Used by `set()`.
     */
    virtual T parse(const std::string & str, const ApplyConfigOptions & options) const;

    /**
     * Append or overwrite `value` with `newValue`.
     *
     * Some types to do not support appending in which case `append`
     * should never be passed. The default handles this case.
     */
    virtual void appendOrSet(T newValue, bool append, const ApplyConfigOptions & options);

public:

    BaseSetting(
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
        , defaultValue(def)
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

    template<typename U>
    bool operator==(const U & v2) const
    {
        return value == v2;
    }

    virtual void assign(const T & v)
    {
        value = v;
    }

    /**
     * Uses `parse()` to get the value from `str`, and `appendOrSet()`
     * to set it.
     */
    void set(const std::string & str, bool append = false, const ApplyConfigOptions & options = {}) override final;

    /**
     * Template-specialized to indicate at compile time whether the type
     * is appendable.
     */
    struct trait;

    bool isAppendable() override final;

    virtual void override(const T & v)
    {
        overridden = true;
        value = v;
    }

    std::string to_string() const override;

    std::map<std::string, JSON> toJSONObject() const override;
};

template<typename T>
std::ostream & operator <<(std::ostream & str, const BaseSetting<T> & opt)
{
    return str << static_cast<const T &>(opt);
}

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * options,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : BaseSetting<T>(def, name, description, aliases)
    {
        options->addSetting(this);
    }

    void operator =(const T & v) { this->assign(v); }
};

/**
 * A special setting for Paths. These are automatically canonicalised
 * (e.g. "/foo//bar/" becomes "/foo/bar"). Relative paths in a
 * configuration file are resolved against the file's directory.
 *
 * It is mandatory to specify a path; i.e. the empty string is not
 * permitted.
 */
class PathSetting : public BaseSetting<Path>
{
public:

    PathSetting(Config * options,
        const Path & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {});

    Path parse(const std::string & str, const ApplyConfigOptions & options) const override;

    Path operator +(const char * p) const { return value + p; }

    void operator =(const Path & v) { this->assign(v); }
};

}
