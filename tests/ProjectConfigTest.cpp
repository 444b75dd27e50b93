// =================================================================
// tests/ProjectConfigTest.cpp
// =================================================================
// Unit tests for descriptor parsing and layered configuration.

#include "Packwright/ProjectConfig.hpp"
#include "Packwright/Core.hpp"
#include "Packwright/Errors.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

class ProjectConfigTest {
private:
    static const char* descriptorText() {
        return
            "project_name: Hello World\n"
            "bundle: com.example\n"
            "version: 0.1.0\n"
            "description: A friendly greeter\n"
            "sources: [src/common]\n"
            "requires: [requests]\n"
            "permission:\n"
            "  camera: Take pictures\n"
            "apps:\n"
            "  hello:\n"
            "    sources: [src/hello]\n"
            "    icon: icons/hello\n"
            "    permission:\n"
            "      microphone: Record greetings\n"
            "    linux:\n"
            "      requires: [gi]\n"
            "      icon: icons/hello-linux\n"
            "      system:\n"
            "        requires: [dbus]\n"
            "        icon: icons/hello-system\n"
            "        permission:\n"
            "          camera: Scan documents\n"
            "  goodbye-world:\n"
            "    description: Says goodbye\n"
            "    sources: [src/goodbye]\n";
    }

    template <typename Error, typename Fn>
    static bool throwsError(Fn fn) {
        try {
            fn();
        } catch (const Error&) {
            return true;
        }
        return false;
    }

public:
    void testParseApps() {
        std::cout << "Testing descriptor parsing..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());
        assert(descriptor.projectName() == "Hello World" && "Should read the project name");

        auto apps = descriptor.appNames();
        assert(apps.size() == 2 && "Should declare two apps");
        assert(apps[0] == "goodbye-world" && apps[1] == "hello" && "App names should be sorted");

        auto formats = descriptor.declaredFormats("hello", "linux");
        assert(formats.size() == 1 && formats[0] == "system" && "Should see the system format section");
        assert(descriptor.declaredFormats("hello", "macOS").empty() && "No macOS section declared");

        std::cout << "✓ Descriptor parsing test passed" << std::endl;
    }

    void testMostSpecificWins() {
        std::cout << "Testing most specific value resolution..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());

        auto system = descriptor.resolve("hello", "linux", "system");
        assert(system.getString("icon") == "icons/hello-system" && "Format layer should win");

        auto linux_other = descriptor.resolve("hello", "linux", "flatpak");
        assert(linux_other.getString("icon") == "icons/hello-linux" && "Platform layer should win");

        auto mac = descriptor.resolve("hello", "macOS", "app");
        assert(mac.getString("icon") == "icons/hello" && "App layer should apply");

        auto overridden = descriptor.resolve("hello", "linux", "system",
            Packwright::ProjectDescriptor::parseOverrides({"icon=icons/override"}));
        assert(overridden.getString("icon") == "icons/override" && "Overrides should beat every layer");

        std::cout << "✓ Most specific value resolution test passed" << std::endl;
    }

    void testCumulativeLists() {
        std::cout << "Testing cumulative lists..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());
        auto system = descriptor.resolve("hello", "linux", "system");

        auto requires_list = system.getList("requires");
        assert(requires_list.size() == 3 && "Requirements should accumulate");
        assert(requires_list[0] == "requests" && "Project entries come first");
        assert(requires_list[1] == "gi" && "Platform entries come next");
        assert(requires_list[2] == "dbus" && "Format entries come last");

        auto sources = system.getList("sources");
        assert(sources.size() == 2 && sources[0] == "src/common" && sources[1] == "src/hello" &&
               "Sources should accumulate from least to most specific");

        auto mac = descriptor.resolve("hello", "macOS", "app");
        assert(mac.getList("requires").size() == 1 && "Other platforms contribute nothing");

        std::cout << "✓ Cumulative lists test passed" << std::endl;
    }

    void testCumulativeTables() {
        std::cout << "Testing cumulative tables..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());

        auto system = descriptor.resolve("hello", "linux", "system");
        auto permissions = system.getTable("permission");
        assert(permissions.size() == 2 && "Permission entries should merge");
        assert(permissions["camera"] == "Scan documents" && "More specific entries should win");
        assert(permissions["microphone"] == "Record greetings" && "App entry should be kept");

        auto goodbye = descriptor.resolve("goodbye-world", "linux", "system");
        assert(goodbye.getTable("permission").size() == 1 && "Project entries apply to every app");

        auto context = system.templateContext();
        assert(context["permission.camera"] == "Scan documents" && "Tables flatten into the template context");

        std::cout << "✓ Cumulative tables test passed" << std::endl;
    }

    void testDerivedKeys() {
        std::cout << "Testing derived keys..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());
        auto config = descriptor.resolve("goodbye-world", "linux", "system");

        assert(config.appName() == "goodbye-world" && "App name should be recorded");
        assert(config.formalName() == "Goodbye World" && "Formal name is the title-cased app name");
        assert(config.moduleName() == "goodbye_world" && "Module name replaces dashes");
        assert(config.bundleIdentifier() == "com.example.goodbye-world" && "Bundle identifier derived from bundle");
        assert(config.description() == "Says goodbye" && "App description overrides the project one");
        assert(config.version() == "0.1.0" && "Version inherited from the project");
        assert(!config.has("not_a_key") && "Unknown keys are absent");
        assert(config.getString("not_a_key", "fallback") == "fallback" && "Defaults apply to absent keys");

        std::cout << "✓ Derived keys test passed" << std::endl;
    }

    void testResolveIsDeterministic() {
        std::cout << "Testing deterministic resolution..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());
        auto overrides = Packwright::ProjectDescriptor::parseOverrides({"requires=extra", "requires=more"});

        auto first = descriptor.resolve("hello", "linux", "system", overrides);
        auto second = descriptor.resolve("hello", "linux", "system", overrides);
        assert(first == second && "Resolving twice should give identical results");

        auto requires_list = first.getList("requires");
        assert(requires_list.size() == 5 && requires_list[4] == "more" &&
               "Repeated list overrides should accumulate after the descriptor entries");

        std::cout << "✓ Deterministic resolution test passed" << std::endl;
    }

    void testOverrideErrors() {
        std::cout << "Testing override errors..." << std::endl;

        using Packwright::ProjectDescriptor;
        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parseOverrides({"version=2.0"});
        }) && "Overriding the version should be rejected");
        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parseOverrides({"app_name=other"});
        }) && "Overriding the app name should be rejected");
        assert(throwsError<Packwright::UserError>([] {
            ProjectDescriptor::parseOverrides({"no-equals-sign"});
        }) && "Entries without '=' should be rejected");

        auto overrides = ProjectDescriptor::parseOverrides({" icon = a=b"});
        assert(overrides["icon"].asString() == " a=b" && "Only the first '=' separates key and value");

        std::cout << "✓ Override errors test passed" << std::endl;
    }

    void testDeclaredCumulativeOverrides() {
        std::cout << "Testing overrides of declared cumulative lists..." << std::endl;

        using Packwright::ProjectDescriptor;
        auto descriptor = ProjectDescriptor::parse(
            "project_name: Flags\n"
            "bundle: com.example\n"
            "version: 1.0.0\n"
            "description: Compiler flag test\n"
            "cumulative: [extra_flags]\n"
            "extra_flags: [-O2]\n"
            "apps:\n"
            "  flags:\n"
            "    sources: [src]\n"
            "    extra_flags: [-g]\n");
        std::vector<std::string> entries = {"extra_flags=-Wall", "extra_flags=-Werror", "icon=a", "icon=b"};

        auto config = descriptor.resolve("flags", "linux", "system", descriptor.overridesFor(entries));
        auto flags = config.getList("extra_flags");
        assert((flags == std::vector<std::string>{"-O2", "-g", "-Wall", "-Werror"}) &&
               "Repeated overrides of a declared cumulative list should all be kept");
        assert(config.getString("icon") == "b" && "Other repeated overrides keep the last value");

        auto builtin = descriptor.resolve("flags", "linux", "system", ProjectDescriptor::parseOverrides(entries));
        assert(builtin.getList("extra_flags").back() == "-Werror" &&
               builtin.getList("extra_flags").size() == 3 &&
               "Without the descriptor only the last override of an undeclared list survives");

        auto requirements = descriptor.overridesFor({"requires=a", "requires=b"});
        assert(requirements["requires"].asList().size() == 2 && "Built-in cumulative lists still accumulate");

        std::cout << "✓ Overrides of declared cumulative lists test passed" << std::endl;
    }

    void testMalformedDescriptors() {
        std::cout << "Testing malformed descriptors..." << std::endl;

        using Packwright::ProjectDescriptor;
        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parse("bundle: com.example\nversion: 1.0\napps:\n  a:\n    description: x\n    sources: [s]\n");
        }) && "Missing project_name should be rejected");

        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parse("project_name: p\nbundle: com.example\nversion: 1.0\n");
        }) && "A descriptor without apps should be rejected");

        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parse("project_name: p\nbundle: com.example\nversion: one\n"
                                     "apps:\n  a:\n    description: x\n    sources: [s]\n");
        }) && "An invalid version should be rejected");

        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parse("project_name: p\nbundle: com.example\nversion: 1.0\n"
                                     "apps:\n  9lives:\n    description: x\n    sources: [s]\n");
        }) && "App names must start with a letter");

        assert(throwsError<Packwright::MalformedConfig>([] {
            ProjectDescriptor::parse("project_name: p\nbundle: com.example\nversion: 1.0\n"
                                     "apps:\n  a:\n    description: x\n");
        }) && "Apps without sources should be rejected");

        bool located = false;
        try {
            ProjectDescriptor::parse("project_name: p\nbundle: com.example\nversion: 1.0\n"
                                     "apps:\n  a:\n    description: x\n    sources: [s]\n"
                                     "    linux:\n      system:\n        nested:\n          deep: 1\n");
        } catch (const Packwright::MalformedConfig& e) {
            located = e.line() == 10 && e.column() > 0;
        }
        assert(located && "Errors should carry the line of the offending entry");

        bool unknown = false;
        try {
            ProjectDescriptor::parse(descriptorText()).resolve("missing", "linux", "system");
        } catch (const Packwright::UserError&) {
            unknown = true;
        }
        assert(unknown && "Resolving an undeclared app should be a user error");

        std::cout << "✓ Malformed descriptors test passed" << std::endl;
    }

    void testSelectApps() {
        std::cout << "Testing app selection..." << std::endl;

        auto descriptor = Packwright::ProjectDescriptor::parse(descriptorText());
        assert(descriptor.selectApps({}).size() == 2 && "Empty selection means every app");

        auto selected = descriptor.selectApps({"hello", "hello"});
        assert(selected.size() == 1 && selected[0] == "hello" && "Duplicates should collapse");

        assert(throwsError<Packwright::UserError>([&] { descriptor.selectApps({"nope"}); }) &&
               "Unknown apps should be rejected");

        std::cout << "✓ App selection test passed" << std::endl;
    }

    void testNewProjectDescriptor() {
        std::cout << "Testing new project files..." << std::endl;

        auto files = Packwright::Core::defaultProjectFiles("hello-world", "org.example");
        assert(files.size() == 5 && "Descriptor, package, entry point and tests are created");
        assert(files.count("src/hello_world/__main__.py") == 1 && "Sources use the module name");
        assert(files["src/hello_world/__main__.py"].find("Hello from Hello World!") != std::string::npos &&
               "The entry point is rendered");

        auto descriptor = Packwright::ProjectDescriptor::parse(files["packwright.yml"]);
        assert(descriptor.appNames() == std::vector<std::string>{"hello-world"} && "The new app is declared");

        auto linux_config = descriptor.resolve("hello-world", "linux", "system");
        assert(linux_config.formalName() == "Hello World" && "The formal name is title cased");
        assert(linux_config.bundleIdentifier() == "org.example.hello-world" && "The bundle prefix is used");
        assert(linux_config.version() == "0.0.1" && "New projects start at 0.0.1");
        assert(linux_config.getList("sources") == std::vector<std::string>{"src/hello_world"} &&
               "The module directory is the only source");
        assert(linux_config.getString("packaging_format") == "tar.gz" && "linux packages as tar.gz");

        auto mac_config = descriptor.resolve("hello-world", "macOS", "app");
        assert(mac_config.getString("packaging_format") == "dmg" && "macOS packages as dmg");

        std::cout << "✓ New project files test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProjectConfig unit tests..." << std::endl;

        testParseApps();
        testMostSpecificWins();
        testCumulativeLists();
        testCumulativeTables();
        testDerivedKeys();
        testResolveIsDeterministic();
        testOverrideErrors();
        testDeclaredCumulativeOverrides();
        testMalformedDescriptors();
        testSelectApps();
        testNewProjectDescriptor();

        std::cout << "All ProjectConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProjectConfigTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ProjectConfig component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
