// =================================================================
// src/Packwright/ProjectConfig.cpp
// =================================================================
// Implementation for descriptor parsing and layered resolution.

#include "Packwright/ProjectConfig.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Version.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

const std::set<std::string> DEFAULT_CUMULATIVE_LISTS = {"requires", "sources", "test_requires", "test_sources"};
const std::set<std::string> CUMULATIVE_TABLES = {"permission", "env", "info"};
const std::set<std::string> IDENTITY_KEYS = {"app_name", "version", "bundle"};

const std::regex APP_NAME_PATTERN("^[a-z][a-z0-9_-]*$", std::regex_constants::icase);
const std::regex BUNDLE_PATTERN("^[A-Za-z0-9-]+(\\.[A-Za-z0-9-]+)+$");

MalformedConfig errorAt(const std::string& origin, const YAML::Node& node, const std::string& message) {
    YAML::Mark mark = node.Mark();
    if (mark.is_null()) {
        return MalformedConfig(origin, 0, 0, message);
    }
    return MalformedConfig(origin, mark.line + 1, mark.column + 1, message);
}

bool isSectionNode(const std::string& key, const YAML::Node& node) {
    return node.IsMap() && !ProjectDescriptor::isCumulativeTable(key);
}

ConfigValue readValue(const std::string& origin, const std::string& key, const YAML::Node& node) {
    if (node.IsScalar()) {
        return ConfigValue::scalar(node.Scalar());
    }

    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw errorAt(origin, item, "'" + key + "' must be a list of plain values");
            }
            items.push_back(item.Scalar());
        }
        return ConfigValue::list(items);
    }

    if (node.IsMap()) {
        std::map<std::string, std::string> entries;
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->second.IsScalar()) {
                throw errorAt(origin, it->second, "'" + key + "." + it->first.Scalar() + "' must be a plain value");
            }
            entries[it->first.Scalar()] = it->second.Scalar();
        }
        return ConfigValue::table(entries);
    }

    return ConfigValue();
}

void readSettings(const std::string& origin, const std::string& key, const YAML::Node& node,
                  ConfigLayerMap& layer) {
    if (node.IsNull()) {
        return;
    }
    layer[key] = readValue(origin, key, node);
}

void validateIdentity(const std::string& origin, const YAML::Node& section, const std::string& where) {
    const YAML::Node version = section["version"];
    if (version && !version.IsNull()) {
        if (!version.IsScalar() || !Version::isValid(version.Scalar())) {
            throw errorAt(origin, version, "'" + version.as<std::string>("") + "' in " + where +
                          " is not a valid version (expected e.g. 1.0, 1.2.3rc1, 2!1.0.post2)");
        }
    }

    const YAML::Node bundle = section["bundle"];
    if (bundle && !bundle.IsNull()) {
        if (!bundle.IsScalar() || !std::regex_match(bundle.Scalar(), BUNDLE_PATTERN)) {
            throw errorAt(origin, bundle, "'" + bundle.as<std::string>("") + "' in " + where +
                          " is not a valid bundle identifier (expected reverse-DNS, e.g. com.example)");
        }
    }
}

std::string titleCase(const std::string& name) {
    std::string result;
    bool start_of_word = true;
    for (char c : name) {
        if (c == '-' || c == '_') {
            result += ' ';
            start_of_word = true;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        result += start_of_word ? static_cast<char>(std::toupper(uc)) : c;
        start_of_word = false;
    }
    return result;
}

std::string joinList(const std::vector<std::string>& items) {
    std::ostringstream joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined << ", ";
        }
        joined << items[i];
    }
    return joined.str();
}

} // anonymous namespace

// ConfigValue

ConfigValue ConfigValue::scalar(const std::string& value) {
    ConfigValue result;
    result.m_kind = Kind::SCALAR;
    result.m_scalar = value;
    return result;
}

ConfigValue ConfigValue::list(const std::vector<std::string>& items) {
    ConfigValue result;
    result.m_kind = Kind::LIST;
    result.m_list = items;
    return result;
}

ConfigValue ConfigValue::table(const std::map<std::string, std::string>& entries) {
    ConfigValue result;
    result.m_kind = Kind::TABLE;
    result.m_table = entries;
    return result;
}

std::string ConfigValue::asString() const {
    switch (m_kind) {
        case Kind::ABSENT: return "";
        case Kind::SCALAR: return m_scalar;
        default:
            throw MalformedConfig("Expected a single value but found " + toString());
    }
}

std::vector<std::string> ConfigValue::asList() const {
    switch (m_kind) {
        case Kind::SCALAR: return {m_scalar};
        case Kind::LIST: return m_list;
        default: return {};
    }
}

std::map<std::string, std::string> ConfigValue::asTable() const {
    return m_kind == Kind::TABLE ? m_table : std::map<std::string, std::string>();
}

std::string ConfigValue::toString() const {
    switch (m_kind) {
        case Kind::ABSENT: return "<absent>";
        case Kind::SCALAR: return m_scalar;
        case Kind::LIST: return "[" + joinList(m_list) + "]";
        case Kind::TABLE: {
            std::vector<std::string> entries;
            for (const auto& [key, value] : m_table) {
                entries.push_back(key + ": " + value);
            }
            return "{" + joinList(entries) + "}";
        }
        default: return "";
    }
}

bool ConfigValue::operator==(const ConfigValue& other) const {
    return m_kind == other.m_kind && m_scalar == other.m_scalar &&
           m_list == other.m_list && m_table == other.m_table;
}

// EffectiveConfig

EffectiveConfig::EffectiveConfig(const std::string& app_name, const std::string& platform,
                                 const std::string& output_format, const ConfigLayerMap& values)
    : m_app_name(app_name), m_platform(platform), m_output_format(output_format), m_values(values) {
}

const ConfigValue& EffectiveConfig::get(const std::string& key) const {
    static const ConfigValue absent;
    auto it = m_values.find(key);
    return it == m_values.end() ? absent : it->second;
}

bool EffectiveConfig::has(const std::string& key) const {
    return !get(key).isAbsent();
}

std::string EffectiveConfig::getString(const std::string& key, const std::string& default_value) const {
    const ConfigValue& value = get(key);
    if (value.isAbsent()) {
        return default_value;
    }
    if (value.kind() == ConfigValue::Kind::LIST) {
        return joinList(value.asList());
    }
    if (value.kind() == ConfigValue::Kind::TABLE) {
        throw MalformedConfig("'" + key + "' for " + m_app_name + " must be a single value, not a table");
    }
    return value.asString();
}

std::vector<std::string> EffectiveConfig::getList(const std::string& key) const {
    return get(key).asList();
}

std::map<std::string, std::string> EffectiveConfig::getTable(const std::string& key) const {
    return get(key).asTable();
}

std::map<std::string, std::string> EffectiveConfig::templateContext() const {
    std::map<std::string, std::string> context;
    for (const auto& [key, value] : m_values) {
        switch (value.kind()) {
            case ConfigValue::Kind::SCALAR:
                context[key] = value.asString();
                break;
            case ConfigValue::Kind::LIST:
                context[key] = joinList(value.asList());
                break;
            case ConfigValue::Kind::TABLE:
                for (const auto& [entry, entry_value] : value.asTable()) {
                    context[key + "." + entry] = entry_value;
                }
                break;
            default:
                break;
        }
    }
    return context;
}

bool EffectiveConfig::operator==(const EffectiveConfig& other) const {
    return m_app_name == other.m_app_name && m_platform == other.m_platform &&
           m_output_format == other.m_output_format && m_values == other.m_values;
}

// ProjectDescriptor

const char* ProjectDescriptor::DEFAULT_FILENAME = "packwright.yml";

bool ProjectDescriptor::isCumulativeTable(const std::string& key) {
    return CUMULATIVE_TABLES.count(key) > 0;
}

ProjectDescriptor ProjectDescriptor::load(const fs::path& path) {
    std::string text;
    try {
        text = readFile(path);
    } catch (const std::runtime_error&) {
        throw MalformedConfig(path.string(), 0, 0,
                              "cannot read project descriptor (run 'packwright new' to create a project)");
    }

    ProjectDescriptor descriptor = parse(text, path.string());
    descriptor.m_root = fs::absolute(path).parent_path();
    return descriptor;
}

ProjectDescriptor ProjectDescriptor::parse(const std::string& text, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw MalformedConfig(origin, e.mark.line + 1, e.mark.column + 1, e.msg);
    }

    if (!root.IsMap()) {
        throw MalformedConfig(origin, 1, 1, "project descriptor must be a mapping of settings");
    }

    ProjectDescriptor descriptor;
    descriptor.m_origin = origin;
    descriptor.m_root = fs::current_path();
    descriptor.m_cumulative_lists = DEFAULT_CUMULATIVE_LISTS;

    const YAML::Node& const_root = root;
    const YAML::Node cumulative = const_root["cumulative"];
    if (cumulative) {
        if (!cumulative.IsSequence()) {
            throw errorAt(origin, cumulative, "'cumulative' must be a list of key names");
        }
        for (const auto& key : cumulative) {
            descriptor.m_cumulative_lists.insert(key.as<std::string>());
        }
    }

    for (auto it = const_root.begin(); it != const_root.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (key == "apps" || key == "cumulative") {
            continue;
        }
        if (isSectionNode(key, it->second)) {
            throw errorAt(origin, it->first, "unexpected section '" + key + "' at project level");
        }
        readSettings(origin, key, it->second, descriptor.m_project);
    }

    for (const char* required : {"project_name", "bundle", "version"}) {
        auto it = descriptor.m_project.find(required);
        if (it == descriptor.m_project.end() || it->second.kind() != ConfigValue::Kind::SCALAR ||
            it->second.asString().empty()) {
            throw MalformedConfig(origin, 0, 0, std::string("missing required project setting '") + required + "'");
        }
    }
    validateIdentity(origin, const_root, "project settings");
    descriptor.m_project_name = descriptor.m_project["project_name"].asString();

    const YAML::Node apps = const_root["apps"];
    if (!apps || !apps.IsMap() || apps.size() == 0) {
        throw MalformedConfig(origin, 0, 0, "no apps declared; add at least one entry under 'apps:'");
    }

    for (auto app_it = apps.begin(); app_it != apps.end(); ++app_it) {
        AppDescriptor app;
        app.name = app_it->first.as<std::string>();
        if (!std::regex_match(app.name, APP_NAME_PATTERN)) {
            throw errorAt(origin, app_it->first, "'" + app.name + "' is not a valid app name "
                          "(letters, digits, '-' and '_', starting with a letter)");
        }

        const YAML::Node app_node = app_it->second;
        if (!app_node.IsMap()) {
            throw errorAt(origin, app_it->first, "app '" + app.name + "' must be a mapping of settings");
        }
        validateIdentity(origin, app_node, "app '" + app.name + "'");

        for (auto it = app_node.begin(); it != app_node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (!isSectionNode(key, it->second)) {
                readSettings(origin, key, it->second, app.values);
                continue;
            }

            PlatformSection& platform = app.platforms[key];
            for (auto p_it = it->second.begin(); p_it != it->second.end(); ++p_it) {
                std::string p_key = p_it->first.as<std::string>();
                if (!isSectionNode(p_key, p_it->second)) {
                    readSettings(origin, p_key, p_it->second, platform.values);
                    continue;
                }

                ConfigLayerMap& format = platform.formats[p_key];
                for (auto f_it = p_it->second.begin(); f_it != p_it->second.end(); ++f_it) {
                    std::string f_key = f_it->first.as<std::string>();
                    if (isSectionNode(f_key, f_it->second)) {
                        throw errorAt(origin, f_it->first, "unexpected section '" + f_key + "' inside " +
                                      app.name + "." + key + "." + p_key);
                    }
                    readSettings(origin, f_key, f_it->second, format);
                }
            }
        }

        bool has_description = app.values.count("description") > 0 ||
                               descriptor.m_project.count("description") > 0;
        if (!has_description) {
            throw errorAt(origin, app_it->first, "app '" + app.name + "' is missing 'description'");
        }

        std::vector<std::string> sources;
        if (descriptor.m_project.count("sources") > 0) {
            sources = descriptor.m_project["sources"].asList();
        }
        if (app.values.count("sources") > 0) {
            auto app_sources = app.values["sources"].asList();
            sources.insert(sources.end(), app_sources.begin(), app_sources.end());
        }
        if (sources.empty()) {
            throw errorAt(origin, app_it->first, "app '" + app.name + "' must list one or more 'sources'");
        }

        descriptor.m_apps[app.name] = app;
    }

    return descriptor;
}

ConfigLayerMap ProjectDescriptor::parseOverrides(const std::vector<std::string>& entries) {
    return parseOverrides(entries, DEFAULT_CUMULATIVE_LISTS);
}

ConfigLayerMap ProjectDescriptor::parseOverrides(const std::vector<std::string>& entries,
                                                 const std::set<std::string>& cumulative_lists) {
    ConfigLayerMap overrides;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw UserError("Invalid configuration override '" + entry + "' (expected key=value)");
        }
        std::string key = entry.substr(0, eq);
        std::string value = entry.substr(eq + 1);
        key.erase(key.find_last_not_of(" \t") + 1);
        key.erase(0, key.find_first_not_of(" \t"));

        if (IDENTITY_KEYS.count(key) > 0) {
            throw MalformedConfig("command line", 0, 0, "'" + key + "' cannot be overridden with -C");
        }

        auto existing = overrides.find(key);
        if (existing != overrides.end() && cumulative_lists.count(key) > 0) {
            auto items = existing->second.asList();
            items.push_back(value);
            existing->second = ConfigValue::list(items);
        } else {
            overrides[key] = ConfigValue::scalar(value);
        }
    }
    return overrides;
}

ConfigLayerMap ProjectDescriptor::overridesFor(const std::vector<std::string>& entries) const {
    return parseOverrides(entries, m_cumulative_lists);
}

EffectiveConfig ProjectDescriptor::resolve(const std::string& app_name, const std::string& platform,
                                           const std::string& output_format,
                                           const ConfigLayerMap& overrides) const {
    const AppDescriptor& descriptor = app(app_name);

    // Least specific first
    std::vector<const ConfigLayerMap*> layers = {&m_project, &descriptor.values};
    auto platform_it = descriptor.platforms.find(platform);
    if (platform_it != descriptor.platforms.end()) {
        layers.push_back(&platform_it->second.values);
        auto format_it = platform_it->second.formats.find(output_format);
        if (format_it != platform_it->second.formats.end()) {
            layers.push_back(&format_it->second);
        }
    }
    layers.push_back(&overrides);

    std::set<std::string> keys;
    for (const auto* layer : layers) {
        for (const auto& entry : *layer) {
            keys.insert(entry.first);
        }
    }

    ConfigLayerMap resolved;
    for (const auto& key : keys) {
        if (isCumulativeList(key)) {
            std::vector<std::string> items;
            for (const auto* layer : layers) {
                auto it = layer->find(key);
                if (it != layer->end()) {
                    auto layer_items = it->second.asList();
                    items.insert(items.end(), layer_items.begin(), layer_items.end());
                }
            }
            resolved[key] = ConfigValue::list(items);
        } else if (isCumulativeTable(key)) {
            std::map<std::string, std::string> merged;
            for (const auto* layer : layers) {
                auto it = layer->find(key);
                if (it != layer->end()) {
                    for (const auto& [entry, value] : it->second.asTable()) {
                        merged[entry] = value;
                    }
                }
            }
            resolved[key] = ConfigValue::table(merged);
        } else {
            for (auto layer = layers.rbegin(); layer != layers.rend(); ++layer) {
                auto it = (*layer)->find(key);
                if (it != (*layer)->end() && !it->second.isAbsent()) {
                    resolved[key] = it->second;
                    break;
                }
            }
        }
    }

    resolved["app_name"] = ConfigValue::scalar(app_name);
    if (resolved.count("platform") == 0) {
        resolved["platform"] = ConfigValue::scalar(platform);
    }
    if (resolved.count("output_format") == 0) {
        resolved["output_format"] = ConfigValue::scalar(output_format);
    }
    if (resolved.count("bundle_identifier") == 0) {
        resolved["bundle_identifier"] = ConfigValue::scalar(resolved["bundle"].asString() + "." + app_name);
    }
    if (resolved.count("formal_name") == 0) {
        resolved["formal_name"] = ConfigValue::scalar(titleCase(app_name));
    }
    if (resolved.count("module_name") == 0) {
        std::string module_name = app_name;
        std::replace(module_name.begin(), module_name.end(), '-', '_');
        resolved["module_name"] = ConfigValue::scalar(module_name);
    }

    return EffectiveConfig(app_name, platform, output_format, resolved);
}

std::vector<std::string> ProjectDescriptor::appNames() const {
    std::vector<std::string> names;
    for (const auto& entry : m_apps) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> ProjectDescriptor::selectApps(const std::vector<std::string>& requested) const {
    if (requested.empty()) {
        return appNames();
    }

    std::vector<std::string> selected;
    for (const auto& name : requested) {
        if (m_apps.count(name) == 0) {
            throw UserError("App '" + name + "' is not declared in " + m_origin);
        }
        if (std::find(selected.begin(), selected.end(), name) == selected.end()) {
            selected.push_back(name);
        }
    }
    return selected;
}

const AppDescriptor& ProjectDescriptor::app(const std::string& name) const {
    auto it = m_apps.find(name);
    if (it == m_apps.end()) {
        throw UserError("App '" + name + "' is not declared in " + m_origin);
    }
    return it->second;
}

std::vector<std::string> ProjectDescriptor::declaredFormats(const std::string& app_name,
                                                            const std::string& platform) const {
    std::vector<std::string> formats;
    const AppDescriptor& descriptor = app(app_name);
    auto platform_it = descriptor.platforms.find(platform);
    if (platform_it != descriptor.platforms.end()) {
        for (const auto& entry : platform_it->second.formats) {
            formats.push_back(entry.first);
        }
    }
    return formats;
}

} // namespace Packwright
