#include <gtest/gtest.h>
#include "../src/overrides.hpp"
#include "../src/archive.hpp"
#include "../src/distribution.hpp"
#include "../src/exception.hpp"
#include "../src/hash.hpp"
#include "../src/localization.hpp"
#include <algorithm>

class OverridesTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
        init_localization();
    }

    static const ArchiveMember* find_member(const std::vector<ArchiveMember>& members, const std::string& path) {
        auto it = std::ranges::find(members, path, &ArchiveMember::path);
        return it == members.end() ? nullptr : &*it;
    }

    static std::string pkg_info(const std::string& name, const std::string& version) {
        return "Metadata-Version: 1.0\nName: " + name + "\nVersion: " + version + "\nSummary: legacy\n";
    }
};

TEST_F(OverridesTest, PlaceholderWheelHasOnlyMetadata) {
    EXPECT_EQ(placeholder_wheel_filename("Adafruit-Blinka", "8.0.0"), "adafruit_blinka-8.0.0-py3-none-any.whl");

    SynthesizedFile wheel = build_placeholder_wheel("Adafruit-Blinka", "8.0.0");
    EXPECT_EQ(wheel.filename, "adafruit_blinka-8.0.0-py3-none-any.whl");

    auto members = read_archive(wheel.content);
    ASSERT_EQ(members.size(), 3u);
    for (const auto& member : members) {
        EXPECT_TRUE(member.path.starts_with("adafruit_blinka-8.0.0.dist-info/")) << member.path;
    }

    const ArchiveMember* metadata = find_member(members, "adafruit_blinka-8.0.0.dist-info/METADATA");
    ASSERT_NE(metadata, nullptr);
    Metadata meta = parse_metadata(metadata->content);
    EXPECT_EQ(meta.name, "Adafruit-Blinka");
    EXPECT_EQ(meta.version, "8.0.0");
    EXPECT_TRUE(meta.requirements.empty());

    const ArchiveMember* record = find_member(members, "adafruit_blinka-8.0.0.dist-info/RECORD");
    ASSERT_NE(record, nullptr);
    auto entries = parse_record(record->content);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].hash, record_hash(metadata->content));

    Distribution dist = load_distribution("adafruit_blinka-8.0.0.dist-info", metadata->content, record->content);
    EXPECT_TRUE(dist.payload().empty());
}

TEST_F(OverridesTest, BuiltinDummies) {
    EXPECT_NE(std::ranges::find(BUILTIN_DUMMY_PACKAGES, "adafruit-blinka"), BUILTIN_DUMMY_PACKAGES.end());
}

TEST_F(OverridesTest, GenerateSetupPy) {
    const std::string setup = generate_setup_py("foo", "1.0", {"foo"}, {"foo_pkg", "foo_pkg.sub"},
                                                {"bar>=1", "say \"hi\""});
    EXPECT_NE(setup.find("from setuptools import setup"), std::string::npos);
    EXPECT_NE(setup.find("name=\"foo\""), std::string::npos);
    EXPECT_NE(setup.find("py_modules=[\"foo\"]"), std::string::npos);
    EXPECT_NE(setup.find("packages=[\"foo_pkg\", \"foo_pkg.sub\"]"), std::string::npos);
    EXPECT_NE(setup.find("\"say \\\"hi\\\"\""), std::string::npos);
}

TEST_F(OverridesTest, RewriteLegacySdist) {
    const std::vector<ArchiveMember> original = {
        {"micropython-foo-0.1/", "", true},
        {"micropython-foo-0.1/PKG-INFO", pkg_info("micropython-foo", "0.1")},
        {"micropython-foo-0.1/setup.py", "import sdist_upip\nsetup(cmdclass={'sdist': sdist_upip.sdist})\n"},
        {"micropython-foo-0.1/foo.py", "def f(): pass\n"},
        {"micropython-foo-0.1/foo_pkg/__init__.py", ""},
        {"micropython-foo-0.1/foo_pkg/sub/__init__.py", ""},
        {"micropython-foo-0.1/foo_pkg/sub/helper.py", ""},
        {"micropython-foo-0.1/micropython_foo.egg-info/requires.txt", "micropython-os\n\n[extra]\nignored\n"},
    };

    auto rewritten = read_archive(rewrite_legacy_sdist(write_tar_gz(original)));
    ASSERT_EQ(rewritten.size(), original.size());

    const ArchiveMember* setup = find_member(rewritten, "micropython-foo-0.1/setup.py");
    ASSERT_NE(setup, nullptr);
    EXPECT_EQ(setup->content.find("sdist_upip"), std::string::npos);
    EXPECT_NE(setup->content.find("name=\"micropython-foo\""), std::string::npos);
    EXPECT_NE(setup->content.find("py_modules=[\"foo\"]"), std::string::npos);
    EXPECT_NE(setup->content.find("packages=[\"foo_pkg\", \"foo_pkg.sub\"]"), std::string::npos);
    EXPECT_NE(setup->content.find("install_requires=[\"micropython-os\"]"), std::string::npos);

    const ArchiveMember* module = find_member(rewritten, "micropython-foo-0.1/foo.py");
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->content, "def f(): pass\n");
}

TEST_F(OverridesTest, RewriteAddsMissingSetupPy) {
    const std::vector<ArchiveMember> original = {
        {"./bar-2.0/PKG-INFO", pkg_info("bar", "2.0") + "Requires-Dist: baz (>=1)\n"},
        {"./bar-2.0/bar.py", ""},
    };
    auto rewritten = read_archive(rewrite_legacy_sdist(write_tar_gz(original)));
    ASSERT_EQ(rewritten.size(), 3u);
    EXPECT_EQ(rewritten.back().path, "bar-2.0/setup.py");
    EXPECT_NE(rewritten.back().content.find("install_requires=[\"baz>=1\"]"), std::string::npos);
}

TEST_F(OverridesTest, RewriteWithoutPkgInfoThrows) {
    const std::vector<ArchiveMember> original = {{"x-1.0/setup.py", ""}};
    EXPECT_THROW(rewrite_legacy_sdist(write_tar_gz(original)), PipkinException);
}
