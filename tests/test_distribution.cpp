#include <gtest/gtest.h>
#include "../src/distribution.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"

class DistributionTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
        init_localization();
    }
};

TEST_F(DistributionTest, NormalizeName) {
    EXPECT_EQ(normalize_name("Foo_Bar"), "foo-bar");
    EXPECT_EQ(normalize_name("foo.-_bar"), "foo-bar");
    EXPECT_EQ(normalize_name("micropython-umqtt.simple"), "micropython-umqtt-simple");
    EXPECT_EQ(normalize_name(" requests "), "requests");
}

TEST_F(DistributionTest, ParseRequirement) {
    Requirement plain = Requirement::parse("adafruit-circuitpython-typing");
    EXPECT_EQ(plain.name, "adafruit-circuitpython-typing");
    EXPECT_TRUE(plain.clauses.empty());
    EXPECT_TRUE(plain.satisfied_by("0.1"));

    Requirement req = Requirement::parse("Foo_Bar[tls, cli]>=1.0,<2 ; python_version >= \"3.7\"");
    EXPECT_EQ(req.name, "foo-bar");
    EXPECT_EQ(req.raw_name, "Foo_Bar");
    ASSERT_EQ(req.extras.size(), 2u);
    EXPECT_EQ(req.extras[1], "cli");
    ASSERT_EQ(req.clauses.size(), 2u);
    EXPECT_EQ(req.clauses[0], std::make_pair(std::string(">="), std::string("1.0")));
    EXPECT_EQ(req.marker, "python_version >= \"3.7\"");
    EXPECT_TRUE(req.satisfied_by("1.5"));
    EXPECT_FALSE(req.satisfied_by("2.0"));
    EXPECT_EQ(req.str(), "Foo_Bar[tls,cli]>=1.0,<2; python_version >= \"3.7\"");

    Requirement parenthesized = Requirement::parse("baz (==1.2.*)");
    ASSERT_EQ(parenthesized.clauses.size(), 1u);
    EXPECT_TRUE(parenthesized.satisfied_by("1.2.7"));

    Requirement url = Requirement::parse("pkg @ https://example.org/pkg.zip");
    EXPECT_EQ(url.name, "pkg");
    EXPECT_TRUE(url.clauses.empty());
}

TEST_F(DistributionTest, ParseRequirementRejectsGarbage) {
    EXPECT_THROW(Requirement::parse(""), MalformedMetadata);
    EXPECT_THROW(Requirement::parse("-e ."), MalformedMetadata);
    EXPECT_THROW(Requirement::parse("foo >> 1"), MalformedMetadata);
}

TEST_F(DistributionTest, MetaDirNames) {
    EXPECT_EQ(make_meta_dir_name("foo-bar", "1.0"), "foo_bar-1.0.dist-info");
    auto [name, version] = parse_meta_dir_name("Foo_Bar-1.0.post1.dist-info");
    EXPECT_EQ(name, "foo-bar");
    EXPECT_EQ(version, "1.0.post1");
    EXPECT_TRUE(is_meta_dir_name("a-1.dist-info"));
    EXPECT_FALSE(is_meta_dir_name("a.dist-info"));
    EXPECT_FALSE(is_meta_dir_name("a-1.egg-info"));
    EXPECT_THROW(parse_meta_dir_name("-1.dist-info"), MalformedMetadata);
}

TEST_F(DistributionTest, ParseMetadata) {
    const std::string text =
        "Metadata-Version: 2.1\r\n"
        "Name: micropython-logging\r\n"
        "Version: 0.6\r\n"
        "Summary: Logging\r\n"
        "  continued summary\r\n"
        "Requires-Dist: micropython-os\r\n"
        "Requires-Dist: micropython-time (>=0.1)\r\n"
        "\r\n"
        "Description: Name: ignored\r\n";
    Metadata meta = parse_metadata(text);
    EXPECT_EQ(meta.name, "micropython-logging");
    EXPECT_EQ(meta.version, "0.6");
    ASSERT_EQ(meta.requirements.size(), 2u);
    EXPECT_EQ(meta.requirements[1].name, "micropython-time");

    EXPECT_THROW(parse_metadata("Name: x\n"), MalformedMetadata);
    EXPECT_THROW(parse_metadata("Name x\nVersion: 1\n"), MalformedMetadata);
}

TEST_F(DistributionTest, ParseRecord) {
    const std::string text =
        "foo/__init__.py,sha256=abc,12\n"
        "\"odd,name.py\",sha256=def,3\n"
        "foo-1.0.dist-info/RECORD,,\n"
        "\n";
    auto entries = parse_record(text);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].path, "foo/__init__.py");
    EXPECT_EQ(entries[0].hash, "sha256=abc");
    EXPECT_EQ(entries[0].size.value(), 12u);
    EXPECT_EQ(entries[1].path, "odd,name.py");
    EXPECT_FALSE(entries[2].size.has_value());

    EXPECT_TRUE(parse_record(render_record(entries)) == entries);

    EXPECT_THROW(parse_record(",sha256=x,1\n"), MalformedMetadata);
    EXPECT_THROW(parse_record("a.py,sha256=x,big\n"), MalformedMetadata);
}

TEST_F(DistributionTest, EqualityIgnoresMetadataFiles) {
    std::vector<RecordEntry> files_a = {{"foo.py", "sha256=1", 10}, {"foo-1.0.dist-info/METADATA", "sha256=a", 5}};
    std::vector<RecordEntry> files_b = {{"foo.py", "sha256=1", 10}, {"Foo-1.0.0.dist-info/METADATA", "sha256=b", 7}};
    Distribution a("foo", "1.0", {}, files_a);
    Distribution b("Foo", "1.0.0", {}, files_b);
    EXPECT_EQ(a.meta_dir(), "foo-1.0.dist-info");
    EXPECT_TRUE(a == b);
    ASSERT_EQ(a.payload().size(), 1u);

    Distribution c("foo", "1.0", {}, {{"foo.py", "sha256=2", 10}});
    EXPECT_FALSE(a == c);
    Distribution d("foo", "1.1", {}, {{"foo.py", "sha256=1", 10}});
    EXPECT_FALSE(a == d);
}

TEST_F(DistributionTest, LoadDistribution) {
    const std::string metadata = render_metadata("Foo-Bar", "2.0", {Requirement::parse("baz>=1")});
    const std::string record = "foo_bar/__init__.py,sha256=x,1\nfoo_bar-2.0.dist-info/METADATA,,\n";
    Distribution dist = load_distribution("foo_bar-2.0.dist-info", metadata, record);
    EXPECT_EQ(dist.name(), "foo-bar");
    EXPECT_EQ(dist.display_name(), "Foo-Bar");
    EXPECT_EQ(dist.version(), "2.0");
    ASSERT_EQ(dist.requirements().size(), 1u);
    EXPECT_EQ(dist.files().size(), 2u);
    EXPECT_EQ(dist.payload().size(), 1u);

    EXPECT_THROW(load_distribution("other-2.0.dist-info", metadata, record), MalformedMetadata);
}
