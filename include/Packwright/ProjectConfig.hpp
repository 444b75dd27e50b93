// =================================================================
// include/Packwright/ProjectConfig.hpp
// =================================================================
// Project descriptor loading and layered configuration resolution.

#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief A configuration value: absent, a scalar, a list or a flat table
 */
class ConfigValue {
public:
    enum class Kind {
        ABSENT,
        SCALAR,
        LIST,
        TABLE
    };

    ConfigValue() = default;

    static ConfigValue scalar(const std::string& value);
    static ConfigValue list(const std::vector<std::string>& items);
    static ConfigValue table(const std::map<std::string, std::string>& entries);

    Kind kind() const { return m_kind; }
    bool isAbsent() const { return m_kind == Kind::ABSENT; }

    /**
     * @brief Scalar text; empty for absent values
     * @throws MalformedConfig for lists and tables
     */
    std::string asString() const;

    /**
     * @brief List items; a scalar is a one element list, absent is empty
     */
    std::vector<std::string> asList() const;

    /**
     * @brief Table entries; empty unless the value is a table
     */
    std::map<std::string, std::string> asTable() const;

    /**
     * @brief Human readable rendering used by diagnostics
     */
    std::string toString() const;

    bool operator==(const ConfigValue& other) const;
    bool operator!=(const ConfigValue& other) const { return !(*this == other); }

private:
    Kind m_kind = Kind::ABSENT;
    std::string m_scalar;
    std::vector<std::string> m_list;
    std::map<std::string, std::string> m_table;
};

/**
 * @brief Keys and values declared at one configuration level
 */
using ConfigLayerMap = std::map<std::string, ConfigValue>;

/**
 * @brief Settings declared for one platform, plus its output-format sections
 */
struct PlatformSection {
    ConfigLayerMap values;
    std::map<std::string, ConfigLayerMap> formats;
};

/**
 * @brief One distributable unit declared under `apps:`
 */
struct AppDescriptor {
    std::string name;
    ConfigLayerMap values;
    std::map<std::string, PlatformSection> platforms;
};

/**
 * @brief Fully resolved configuration for one (app, platform, format) triple
 *
 * Unknown keys resolve to an absent value so that callers can apply their
 * own defaults.
 */
class EffectiveConfig {
public:
    EffectiveConfig() = default;
    EffectiveConfig(const std::string& app_name, const std::string& platform,
                    const std::string& output_format, const ConfigLayerMap& values);

    const ConfigValue& get(const std::string& key) const;
    bool has(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& default_value = "") const;
    std::vector<std::string> getList(const std::string& key) const;
    std::map<std::string, std::string> getTable(const std::string& key) const;

    const ConfigLayerMap& values() const { return m_values; }

    const std::string& appName() const { return m_app_name; }
    const std::string& platform() const { return m_platform; }
    const std::string& outputFormat() const { return m_output_format; }

    std::string version() const { return getString("version"); }
    std::string description() const { return getString("description"); }
    std::string bundleIdentifier() const { return getString("bundle_identifier"); }
    std::string formalName() const { return getString("formal_name"); }
    std::string moduleName() const { return getString("module_name"); }

    /**
     * @brief Flat key/value context for template rendering
     *
     * Scalars are used as-is, lists are joined with ", " and table entries
     * appear as "key.entry".
     */
    std::map<std::string, std::string> templateContext() const;

    bool operator==(const EffectiveConfig& other) const;
    bool operator!=(const EffectiveConfig& other) const { return !(*this == other); }

private:
    std::string m_app_name;
    std::string m_platform;
    std::string m_output_format;
    ConfigLayerMap m_values;
};

/**
 * @brief The parsed packwright.yml project descriptor
 *
 * Resolution visits the layers {overrides, output-format, platform, app,
 * project} and takes the first defined value. Cumulative list keys are
 * concatenated from least to most specific instead, and cumulative table
 * keys are merged entry by entry with more specific entries winning.
 */
class ProjectDescriptor {
public:
    static const char* DEFAULT_FILENAME;

    /**
     * @brief Load and validate a descriptor file
     * @throws MalformedConfig naming the file, line and column of the problem
     */
    static ProjectDescriptor load(const std::filesystem::path& path);

    /**
     * @brief Parse descriptor text
     * @param origin File name used in error messages
     */
    static ProjectDescriptor parse(const std::string& text, const std::string& origin = DEFAULT_FILENAME);

    /**
     * @brief Turn "key=value" command-line entries into an override layer
     *
     * A key repeated on the command line accumulates when it is one of
     * `cumulative_lists`; otherwise the last entry wins.
     * @throws UserError for entries without '='
     * @throws MalformedConfig when an identity key (app_name, version, bundle) is overridden
     */
    static ConfigLayerMap parseOverrides(const std::vector<std::string>& entries,
                                         const std::set<std::string>& cumulative_lists);

    /**
     * @brief parseOverrides() with the built-in cumulative lists
     */
    static ConfigLayerMap parseOverrides(const std::vector<std::string>& entries);

    /**
     * @brief parseOverrides() with the lists this descriptor declares cumulative
     */
    ConfigLayerMap overridesFor(const std::vector<std::string>& entries) const;

    /**
     * @brief Resolve the effective configuration of one app
     * @throws UserError if the app is not declared
     */
    EffectiveConfig resolve(const std::string& app_name, const std::string& platform,
                            const std::string& output_format,
                            const ConfigLayerMap& overrides = ConfigLayerMap()) const;

    /**
     * @brief All declared app names, sorted
     */
    std::vector<std::string> appNames() const;

    /**
     * @brief Filter apps by a --app selection; empty selects every app
     * @throws UserError if a requested app is not declared
     */
    std::vector<std::string> selectApps(const std::vector<std::string>& requested) const;

    const AppDescriptor& app(const std::string& name) const;

    /**
     * @brief Output format sections the app declares for a platform
     */
    std::vector<std::string> declaredFormats(const std::string& app_name, const std::string& platform) const;

    const ConfigLayerMap& projectLayer() const { return m_project; }
    const std::string& projectName() const { return m_project_name; }
    const std::filesystem::path& rootDirectory() const { return m_root; }

    bool isCumulativeList(const std::string& key) const { return m_cumulative_lists.count(key) > 0; }
    static bool isCumulativeTable(const std::string& key);

private:
    std::string m_origin;
    std::filesystem::path m_root;
    std::string m_project_name;
    ConfigLayerMap m_project;
    std::map<std::string, AppDescriptor> m_apps;
    std::set<std::string> m_cumulative_lists;
};

} // namespace Packwright
