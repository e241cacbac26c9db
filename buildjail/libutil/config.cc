#include "buildjail/libutil/config.hh"
#include "buildjail/libutil/config-impl.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/strings.hh"

namespace buildjail {

AbstractConfig::AbstractConfig(StringMap initials)
    : unknownSettings(std::move(initials))
{ }

Config::Config(StringMap initials)
    : AbstractConfig(std::move(initials))
{ }

bool Config::set(const std::string & name, const std::string & value, const ApplyConfigOptions & options)
{
    bool append = false;
    auto i = _settings.find(name);
    if (i == _settings.end()) {
        if (name.starts_with("extra-")) {
            i = _settings.find(std::string(name, 6));
            if (i == _settings.end() || !i->second.setting->isAppendable()) {
                unknownSettings.emplace(name, value);
                return false;
            }
            append = true;
        } else {
            unknownSettings.emplace(name, value);
            return false;
        }
    }
    i->second.setting->set(value, append, options);
    i->second.setting->overridden = true;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, Config::SettingData{false, setting});
    for (const auto & alias : setting->aliases)
        _settings.emplace(alias, Config::SettingData{true, setting});

    bool set = false;

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(std::move(i->second));
        setting->overridden = true;
        unknownSettings.erase(i);
        set = true;
    }

    for (auto & alias : setting->aliases) {
        if (auto i = unknownSettings.find(alias); i != unknownSettings.end()) {
            if (set)
                printTaggedWarning("setting '%s' is set, but it's an alias of '%s' which is also set",
                    alias, setting->name);
            else {
                setting->set(std::move(i->second));
                setting->overridden = true;
                unknownSettings.erase(i);
                set = true;
            }
        }
    }
}

void AbstractConfig::warnUnknownSettings()
{
    for (const auto & s : unknownSettings)
        printTaggedWarning("unknown setting '%s'", s.first);
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly)
{
    for (const auto & opt : _settings)
        if (!opt.second.isAlias && (!overriddenOnly || opt.second.setting->overridden))
            res.emplace(opt.first, SettingInfo{opt.second.setting->to_string(), opt.second.setting->description});
}


static void applyConfigInner(const std::string & contents, const ApplyConfigOptions & options, std::vector<std::pair<std::string, std::string>> & parsedContents) {
    unsigned int pos = 0;

    while (pos < contents.size()) {
        std::string line;
        while (pos < contents.size() && contents[pos] != '\n')
            line += contents[pos++];
        pos++;

        if (auto hash = line.find('#'); hash != line.npos)
            line = std::string(line, 0, hash);

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty()) continue;

        if (tokens.size() < 2)
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.relativeDisplay());

        auto include = false;
        auto ignoreMissing = false;
        if (tokens[0] == "include")
            include = true;
        else if (tokens[0] == "!include") {
            include = true;
            ignoreMissing = true;
        }

        if (include) {
            if (tokens.size() != 2) {
                throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.relativeDisplay());
            }
            if (!options.path) {
                throw UsageError("can only include configuration '%1%' from files", tokens[1]);
            }
            auto pathToInclude = absPath(tokens[1], dirOf(*options.path));
            if (pathExists(pathToInclude)) {
                auto includeOptions = ApplyConfigOptions {
                    .path = pathToInclude,
                };
                std::string includedContents = readFile(pathToInclude);
                applyConfigInner(includedContents, includeOptions, parsedContents);
            } else if (!ignoreMissing) {
                throw Error("file '%1%' included from '%2%' not found", pathToInclude, *options.path);
            }
            continue;
        }

        if (tokens[1] != "=")
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.relativeDisplay());

        std::string name = std::move(tokens[0]);

        auto i = tokens.begin();
        advance(i, 2);

        parsedContents.push_back({
            std::move(name),
            concatStringsSep(" ", Strings(i, tokens.end())),
        });
    };
}

void AbstractConfig::applyConfig(const std::string & contents, const ApplyConfigOptions & options) {
    std::vector<std::pair<std::string, std::string>> parsedContents;

    applyConfigInner(contents, options, parsedContents);

    for (const auto & [name, value] : parsedContents)
        set(name, value, options);
}

void AbstractConfig::applyConfigFile(const Path & path)
{
    if (!pathExists(path)) {
        debug("no configuration file at '%s'", path);
        return;
    }
    debug("loading configuration from '%s'", path);
    applyConfig(readFile(path), ApplyConfigOptions{.path = path});
}

void Config::resetOverridden()
{
    for (auto & s : _settings)
        s.second.setting->overridden = false;
}

JSON Config::toJSON()
{
    auto res = JSON::object();
    for (const auto & s : _settings)
        if (!s.second.isAlias)
            res.emplace(s.first, s.second.setting->toJSON());
    return res;
}

std::string Config::toKeyValue(bool overriddenOnly)
{
    std::string res;
    std::map<std::string, Config::SettingInfo> settings;
    getSettings(settings, overriddenOnly);
    for (const auto & s : settings)
        res += fmt("%s = %s\n", s.first, s.second.value);
    return res;
}

AbstractSetting::AbstractSetting(
    const std::string & name,
    const std::string & description,
    const StringSet & aliases)
    : name(name)
    , description(trim(description))
    , aliases(aliases)
{
}

JSON AbstractSetting::toJSON()
{
    return JSON(toJSONObject());
}

std::map<std::string, JSON> AbstractSetting::toJSONObject() const
{
    std::map<std::string, JSON> obj;
    obj.emplace("description", description);
    obj.emplace("aliases", aliases);
    return obj;
}

bool AbstractSetting::isOverridden() const { return overridden; }

template<> std::string BaseSetting<std::string>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return str;
}

template<> std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<> bool BaseSetting<bool>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    else if (str == "false" || str == "no" || str == "0")
        return false;
    else
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<> std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template<> Strings BaseSetting<Strings>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return tokenizeString<Strings>(str);
}

template<> void BaseSetting<Strings>::appendOrSet(Strings newValue, bool append, const ApplyConfigOptions & options)
{
    if (!append) value.clear();
    value.insert(value.end(), std::make_move_iterator(newValue.begin()),
                              std::make_move_iterator(newValue.end()));
}

template<> std::string BaseSetting<Strings>::to_string() const
{
    return concatStringsSep(" ", value);
}

template<> StringSet BaseSetting<StringSet>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return tokenizeString<StringSet>(str);
}

template<> void BaseSetting<StringSet>::appendOrSet(StringSet newValue, bool append, const ApplyConfigOptions & options)
{
    if (!append) value.clear();
    value.insert(std::make_move_iterator(newValue.begin()), std::make_move_iterator(newValue.end()));
}

template<> std::string BaseSetting<StringSet>::to_string() const
{
    return concatStringsSep(" ", value);
}

template class BaseSetting<unsigned int>;
template class BaseSetting<unsigned long>;
template class BaseSetting<unsigned long long>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;
template class BaseSetting<Strings>;
template class BaseSetting<StringSet>;

PathSetting::PathSetting(Config * options,
    const Path & def,
    const std::string & name,
    const std::string & description,
    const StringSet & aliases)
    : BaseSetting<Path>(def, name, description, aliases)
{
    options->addSetting(this);
}

Path PathSetting::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "")
        throw UsageError("setting '%s' is a path and paths cannot be empty", name);
    if (options.path)
        return absPath(str, dirOf(*options.path));
    return absPath(str);
}

}
