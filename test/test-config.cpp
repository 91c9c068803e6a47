#include "talon-config.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>

using namespace talon;
using nlohmann::json;

namespace
{

const char *validConfig = R"({
    "daemon": "onemetre_telescope",
    "log_name": "teld@onemetre",
    "control_machines": ["OneMetreTCS"],
    "virtual": true,
    "focus_tolerance": 0.005,
    "query_delay": 1,
    "initialization_timeout": 60,
    "slew_timeout": 120,
    "focus_timeout": 300,
    "homing_timeout": 300,
    "limit_timeout": 300,
    "cover_timeout": 60,
    "roof_open_timeout": 120,
    "roof_close_timeout": 120,
    "ping_timeout": 10,
    "has_roof": true,
    "has_covers": false,
    "has_focus": true,
    "ha_soft_limits": [-90, 90],
    "dec_soft_limits": [-30, 85],
    "park_positions": {
        "stow": { "desc": "general purpose park position", "alt": 40, "az": 0 }
    }
})";

class ConfigTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            addresses.addDaemon("onemetre_telescope", "10.2.6.1", 9003);
            addresses.addDaemon("onemetre_roomalert", "10.2.6.2", 9008);
            addresses.addMachine("OneMetreTCS", "10.2.6.1");
            doc = json::parse(validConfig);
        }

        std::vector<std::string> errors() const
        {
            return Config::validate(doc, addresses);
        }

        bool hasError(const std::string &message) const
        {
            std::vector<std::string> e = errors();
            return std::find(e.begin(), e.end(), message) != e.end();
        }

        AddressBook addresses;
        json doc;
};

}

TEST_F(ConfigTest, ValidConfig)
{
    EXPECT_TRUE(errors().empty());

    Config config = Config::parse(doc.dump(), addresses);
    EXPECT_EQ("onemetre_telescope", config.daemon.name);
    EXPECT_EQ("10.2.6.1", config.daemon.host);
    EXPECT_EQ(9003, config.daemon.port);
    EXPECT_EQ("teld@onemetre", config.logName);
    EXPECT_TRUE(config.virtualTelescope);
    EXPECT_DOUBLE_EQ(1.0, config.queryDelay);
    EXPECT_DOUBLE_EQ(10.0, config.pingTimeout);
    EXPECT_DOUBLE_EQ(0.005, config.focusTolerance);
    EXPECT_TRUE(config.hasRoof);
    EXPECT_FALSE(config.hasCovers);
    EXPECT_DOUBLE_EQ(-90.0, config.haSoftLimits[0]);
    EXPECT_DOUBLE_EQ(85.0, config.decSoftLimits[1]);
    EXPECT_EQ(LAYOUT_LEGACY, config.layout);
    EXPECT_FALSE(config.hasSecuritySystem);

    EXPECT_TRUE(config.isControlIp("10.2.6.1"));
    EXPECT_FALSE(config.isControlIp("10.2.6.99"));

    ASSERT_EQ(1u, config.parkPositions.size());
    const ParkPosition *stow = config.findParkPosition("stow");
    ASSERT_NE(nullptr, stow);
    EXPECT_EQ("general purpose park position", stow->desc);
    EXPECT_DOUBLE_EQ(40.0, stow->alt);
    EXPECT_EQ(nullptr, config.findParkPosition("zenith"));
}

TEST_F(ConfigTest, MissingRequiredField)
{
    doc.erase("query_delay");
    EXPECT_TRUE(hasError("'query_delay' is a required property"));

    try {
        Config::parse(doc.dump(), addresses);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_EQ(std::string("Invalid configuration:\n\t'query_delay' is a required property"), e.what());
        ASSERT_EQ(1u, e.getErrors().size());
    }
}

TEST_F(ConfigTest, AdditionalProperties)
{
    doc["foo"] = 1;
    EXPECT_TRUE(hasError("Additional properties are not allowed ('foo' was unexpected)"));
}

TEST_F(ConfigTest, WrongTypes)
{
    doc["query_delay"] = "fast";
    doc["virtual"] = 1;
    doc["log_name"] = 5;

    std::vector<std::string> e = errors();
    ASSERT_EQ(3u, e.size());
    EXPECT_EQ("log_name: 5 is not of type 'string'", e[0]);
    EXPECT_EQ("query_delay: \"fast\" is not of type 'number'", e[1]);
    EXPECT_EQ("virtual: 1 is not of type 'boolean'", e[2]);
}

TEST_F(ConfigTest, NumberRanges)
{
    doc["ping_timeout"] = -1;
    doc["ha_soft_limits"] = json::parse("[-200, 0]");
    doc["dec_soft_limits"] = json::parse("[0]");

    EXPECT_TRUE(hasError("ping_timeout: -1 is less than the minimum of 0"));
    EXPECT_TRUE(hasError("ha_soft_limits->0: -200 is less than the minimum of -180"));
    EXPECT_TRUE(hasError("dec_soft_limits: [0] is too short"));
}

TEST_F(ConfigTest, UnknownNames)
{
    doc["daemon"] = "nope";
    doc["control_machines"] = json::parse("[\"OneMetreTCS\", \"Laptop\"]");

    EXPECT_TRUE(hasError("daemon: nope is not a valid daemon name"));
    EXPECT_TRUE(hasError("control_machines->1: Laptop is not a valid machine name"));
    EXPECT_EQ(2u, errors().size());
}

TEST_F(ConfigTest, ParkPositions)
{
    doc["park_positions"]["zenith"] = json::parse(R"({ "desc": "zenith", "alt": 95, "az": 0, "speed": 2 })");
    doc["park_positions"]["flat"] = json::parse(R"({ "alt": 60, "az": 400 })");

    std::vector<std::string> e = errors();
    ASSERT_EQ(4u, e.size());
    EXPECT_EQ("park_positions->flat: 'desc' is a required property", e[0]);
    EXPECT_EQ("park_positions->flat->az: 400 is greater than the maximum of 360", e[1]);
    EXPECT_EQ("park_positions->zenith: Additional properties are not allowed ('speed' was unexpected)", e[2]);
    EXPECT_EQ("park_positions->zenith->alt: 95 is greater than the maximum of 90", e[3]);
}

TEST_F(ConfigTest, ErrorsSortedByPath)
{
    doc["slew_timeout"] = "x";
    doc["daemon"] = 3;
    doc.erase("has_focus");

    std::vector<std::string> e = errors();
    ASSERT_EQ(3u, e.size());
    EXPECT_EQ("'has_focus' is a required property", e[0]);
    EXPECT_EQ("daemon: 3 is not of type 'string'", e[1]);
    EXPECT_EQ("slew_timeout: \"x\" is not of type 'number'", e[2]);
}

TEST_F(ConfigTest, LayoutVariant)
{
    doc["talon_layout"] = "compact";
    EXPECT_EQ(LAYOUT_COMPACT, Config::parse(doc.dump(), addresses).layout);

    doc["talon_layout"] = "rev2";
    EXPECT_TRUE(hasError("talon_layout: \"rev2\" is not one of ['legacy', 'compact']"));
}

TEST_F(ConfigTest, SecuritySystemPair)
{
    doc["security_system_daemon"] = "onemetre_roomalert";
    EXPECT_TRUE(hasError("'security_system_key' is a dependency of 'security_system_daemon'"));

    doc["security_system_key"] = "security_system_safe";
    EXPECT_TRUE(errors().empty());

    Config config = Config::parse(doc.dump(), addresses);
    EXPECT_TRUE(config.hasSecuritySystem);
    EXPECT_EQ(9008, config.securitySystemDaemon.port);
    EXPECT_EQ("security_system_safe", config.securitySystemKey);

    doc.erase("security_system_daemon");
    EXPECT_TRUE(hasError("'security_system_daemon' is a dependency of 'security_system_key'"));
}

TEST_F(ConfigTest, NotAnObject)
{
    std::vector<std::string> e = Config::validate(json::parse("[1, 2]"), addresses);
    ASSERT_EQ(1u, e.size());
    EXPECT_EQ("[1,2] is not of type 'object'", e[0]);
}

TEST_F(ConfigTest, InvalidJson)
{
    EXPECT_THROW(Config::parse("{ \"daemon\": ", addresses), ConfigError);
    EXPECT_THROW(Config::load("/nonexistent/talon.json", addresses), ConfigError);
}

TEST(AddressBook, Parse)
{
    AddressBook book = AddressBook::parse(R"({
        "daemons": { "onemetre_telescope": { "host": "10.2.6.1", "port": 9003 } },
        "machines": { "OneMetreTCS": "10.2.6.1" }
    })");

    DaemonEndpoint d;
    ASSERT_TRUE(book.findDaemon("onemetre_telescope", d));
    EXPECT_EQ("onemetre_telescope", d.name);
    EXPECT_EQ("10.2.6.1", d.host);
    EXPECT_EQ(9003, d.port);
    EXPECT_FALSE(book.findDaemon("onemetre_power", d));

    std::string ip;
    ASSERT_TRUE(book.findMachine("OneMetreTCS", ip));
    EXPECT_EQ("10.2.6.1", ip);
}

TEST(AddressBook, InvalidEntries)
{
    try {
        AddressBook::parse(R"({ "daemons": { "t": { "host": "a" } }, "machines": { "m": 5 } })");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        ASSERT_EQ(2u, e.getErrors().size());
        EXPECT_EQ("machines->m: 5 is not of type 'string'", e.getErrors()[1]);
    }

    EXPECT_THROW(AddressBook::parse("[]"), ConfigError);
}

TEST(ConfigFiles, ShippedExample)
{
    AddressBook book = AddressBook::load(TALON_CONFIG_DIR "/addresses.json");
    Config config = Config::load(TALON_CONFIG_DIR "/onemetre.json", book);

    EXPECT_EQ(9003, config.daemon.port);
    EXPECT_EQ(2u, config.controlIps.size());
    EXPECT_TRUE(config.hasSecuritySystem);
    ASSERT_NE(nullptr, config.findParkPosition("zenith"));
    EXPECT_DOUBLE_EQ(90.0, config.findParkPosition("zenith")->alt);
}
