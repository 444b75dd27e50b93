// =================================================================
// tests/VersionTest.cpp
// =================================================================
// Unit tests for version parsing, ordering and ranges.

#include "Packwright/Version.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

class VersionTest {
public:
    void testParsing() {
        std::cout << "Testing version parsing..." << std::endl;

        auto version = Packwright::Version::parse("1.2.3");
        assert(version.release().size() == 3 && "Should parse three release segments");
        assert(version.release()[1] == 2 && "Second segment should be 2");
        assert(version.toString() == "1.2.3" && "Should keep the original text");
        assert(!version.isPrerelease() && "Final release is not a pre-release");

        assert(Packwright::Version::parse("2.0rc1").isPrerelease() && "rc should be a pre-release");
        assert(Packwright::Version::parse("2.0.dev3").isPrerelease() && "dev should be a pre-release");
        assert(Packwright::Version::isValid("1!2.0.post1") && "Epoch and post releases should be valid");

        std::cout << "✓ Version parsing test passed" << std::endl;
    }

    void testInvalidVersions() {
        std::cout << "Testing invalid versions..." << std::endl;

        assert(!Packwright::Version::isValid("") && "Empty text is not a version");
        assert(!Packwright::Version::isValid("1.2.x") && "Letters are not release segments");
        assert(!Packwright::Version::isValid("01.2") && "Leading zeros are rejected");

        bool threw = false;
        try {
            Packwright::Version::parse("not-a-version");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Parsing an invalid version should throw");

        std::cout << "✓ Invalid versions test passed" << std::endl;
    }

    void testOrdering() {
        std::cout << "Testing version ordering..." << std::endl;

        using Packwright::Version;
        assert(Version::parse("1.2") == Version::parse("1.2.0") && "Trailing zeros should not matter");
        assert(Version::parse("1.10") > Version::parse("1.9") && "Segments compare numerically");
        assert(Version::parse("1.0a1") < Version::parse("1.0b1") && "Alpha sorts before beta");
        assert(Version::parse("1.0rc2") < Version::parse("1.0") && "Pre-release sorts before final");
        assert(Version::parse("1.0.dev1") < Version::parse("1.0a1") && "Dev sorts before alpha");
        assert(Version::parse("1.0.post1") > Version::parse("1.0") && "Post release sorts after final");
        assert(Version::parse("1!0.1") > Version::parse("99.0") && "Epoch dominates");

        std::cout << "✓ Version ordering test passed" << std::endl;
    }

    void testRanges() {
        std::cout << "Testing version ranges..." << std::endl;

        using Packwright::Version;
        using Packwright::VersionRange;

        auto range = VersionRange::parse(">=1.2, <2");
        assert(range.contains(Version::parse("1.2")) && "Lower bound is inclusive");
        assert(range.contains(Version::parse("1.9.9")) && "Value inside the range");
        assert(!range.contains(Version::parse("2.0")) && "Upper bound is exclusive");
        assert(!range.contains(Version::parse("1.1")) && "Below the range");

        auto exact = VersionRange::parse("1.4");
        assert(exact.contains(Version::parse("1.4.0")) && "Bare version means equality");
        assert(!exact.contains(Version::parse("1.4.1")) && "Equality is exact");

        auto excluded = VersionRange::parse("!=3.0");
        assert(!excluded.contains(Version::parse("3.0")) && "Excluded version");
        assert(excluded.contains(Version::parse("3.1")) && "Other versions allowed");

        assert(VersionRange::parse("").isAny() && "Empty range accepts anything");
        assert(VersionRange::parse("").contains(Version::parse("0.1")) && "Empty range contains everything");

        bool threw = false;
        try {
            VersionRange::parse(">=banana");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Invalid clause should throw");

        std::cout << "✓ Version ranges test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Version unit tests..." << std::endl;

        testParsing();
        testInvalidVersions();
        testOrdering();
        testRanges();

        std::cout << "All Version tests passed!" << std::endl;
    }
};

int main() {
    try {
        VersionTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Version component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
