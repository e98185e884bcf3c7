#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "zonegen_dataset.h"
#include "zonegen_emit.h"
#include "zonegen_errors.h"
#include "zonegen_fetch.h"
#include "zonegen_hash.h"

static std::string fixture()
{
    return zonegen_read_file(std::filesystem::path(SYSTZ_TEST_DATA_DIR) / "windowsZones.xml");
}

static std::string document(const std::string& mapZones,
    const std::string& mapTimezones = "<mapTimezones otherVersion=\"7e11800\" typeVersion=\"2021a\">")
{
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
        "<supplementalData>\n"
        "  <version number=\"$Revision$\"/>\n"
        "  <windowsZones>\n"
        "    " + mapTimezones + "\n"
        + mapZones +
        "    </mapTimezones>\n"
        "  </windowsZones>\n"
        "</supplementalData>\n";
}

static ZoneGenStage failing_stage(const std::string& input)
{
    try
    {
        WindowsZonesData::Parse(input);
    }
    catch (const ZoneGenException& e)
    {
        return e.GetStage();
    }
    ADD_FAILURE() << "the document was accepted";
    return ZoneGenStage::Emit;
}

TEST(ZoneGenParseTest, Fixture)
{
    WindowsZonesData data = WindowsZonesData::Parse(fixture());
    EXPECT_EQ(data.GetOtherVersion(), "7e11800");
    EXPECT_EQ(data.GetTypeVersion(), "2021a");

    const auto& zones = data.GetZones();
    ASSERT_EQ(zones.size(), 82u);

    EXPECT_EQ(zones[0].zone, "Dateline Standard Time");
    EXPECT_EQ(zones[0].territory, "001");
    ASSERT_EQ(zones[0].iana.size(), 1u);
    EXPECT_EQ(zones[0].iana[0].GetName(), "Etc/GMT+12");

    auto alaska = std::find_if(zones.begin(), zones.end(), [](const MapZone& z)
    {
        return z.zone == "Alaskan Standard Time" && z.territory == "US";
    });
    ASSERT_NE(alaska, zones.end());
    ASSERT_EQ(alaska->iana.size(), 6u);
    EXPECT_EQ(alaska->iana[0].GetName(), "America/Anchorage");
    EXPECT_EQ(alaska->iana[5].GetName(), "America/Yakutat");
}

TEST(ZoneGenParseTest, SyntheticZoneIsAppended)
{
    WindowsZonesData data = WindowsZonesData::Parse(fixture());
    data.AddSyntheticZones();

    ASSERT_EQ(data.GetZones().size(), 83u);
    const MapZone& utc = data.GetZones().back();
    EXPECT_EQ(utc.zone, "Coordinated Universal Time");
    EXPECT_FALSE(utc.territory.has_value());
    ASSERT_EQ(utc.iana.size(), 1u);
    EXPECT_EQ(utc.iana[0].GetName(), "Etc/UTC");
}

TEST(ZoneGenParseTest, OptionalTerritory)
{
    WindowsZonesData data = WindowsZonesData::Parse(document(
        "<mapZone other=\"Tokyo Standard Time\" type=\"Asia/Tokyo\"/>\n"));
    ASSERT_EQ(data.GetZones().size(), 1u);
    EXPECT_FALSE(data.GetZones()[0].territory.has_value());
}

TEST(ZoneGenParseTest, ExtraWhitespaceInType)
{
    WindowsZonesData data = WindowsZonesData::Parse(document(
        "<mapZone other=\"UTC\" territory=\"ZZ\" type=\"  Etc/UTC \n\t Etc/GMT  \"/>\n"));
    ASSERT_EQ(data.GetZones()[0].iana.size(), 2u);
    EXPECT_EQ(data.GetZones()[0].iana[1].GetName(), "Etc/GMT");
}

TEST(ZoneGenParseTest, OtherSectionsAreSkipped)
{
    std::string input =
        "<supplementalData>\n"
        "  <version number=\"$Revision$\"/>\n"
        "  <metaZones><metazoneInfo><timezone type=\"Europe/Paris\"/></metazoneInfo></metaZones>\n"
        "  <windowsZones>\n"
        "    <mapTimezones otherVersion=\"a\" typeVersion=\"b\">\n"
        "      <!-- (UTC+01:00) Brussels, Copenhagen, Madrid, Paris -->\n"
        "      <mapZone other=\"Romance Standard Time\" territory=\"001\" type=\"Europe/Paris\"/>\n"
        "    </mapTimezones>\n"
        "  </windowsZones>\n"
        "</supplementalData>\n";
    WindowsZonesData data = WindowsZonesData::Parse(input);
    ASSERT_EQ(data.GetZones().size(), 1u);
    EXPECT_EQ(data.GetZones()[0].zone, "Romance Standard Time");
}

TEST(ZoneGenParseTest, UnknownIanaNameAborts)
{
    EXPECT_EQ(failing_stage(document(
        "<mapZone other=\"Olympus Standard Time\" territory=\"001\" type=\"Mars/Olympus\"/>\n")),
        ZoneGenStage::Validate);

    // Names are matched exactly.
    EXPECT_EQ(failing_stage(document(
        "<mapZone other=\"Romance Standard Time\" territory=\"001\" type=\"europe/paris\"/>\n")),
        ZoneGenStage::Validate);

    // ICU knows this one, but it is not an IANA name.
    EXPECT_EQ(failing_stage(document(
        "<mapZone other=\"Pacific Standard Time\" territory=\"001\" type=\"PST\"/>\n")),
        ZoneGenStage::Validate);

    // One bad candidate is enough.
    EXPECT_EQ(failing_stage(document(
        "<mapZone other=\"Romance Standard Time\" territory=\"ES\" type=\"Europe/Madrid Mars/Olympus\"/>\n")),
        ZoneGenStage::Validate);
}

TEST(ZoneGenParseTest, EmptyTypeAborts)
{
    EXPECT_EQ(failing_stage(document(
        "<mapZone other=\"Romance Standard Time\" territory=\"001\" type=\" \"/>\n")),
        ZoneGenStage::Validate);
}

TEST(ZoneGenParseTest, MissingAttributesAbort)
{
    EXPECT_EQ(failing_stage(document("<mapZone territory=\"001\" type=\"Europe/Paris\"/>\n")),
        ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage(document("<mapZone other=\"Romance Standard Time\" territory=\"001\"/>\n")),
        ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage(document("", "<mapTimezones otherVersion=\"7e11800\">")),
        ZoneGenStage::Parse);
}

TEST(ZoneGenParseTest, UnexpectedElementAborts)
{
    EXPECT_EQ(failing_stage(document("<mapZones other=\"x\" type=\"Europe/Paris\"/>\n")),
        ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage(document(
        "<mapZone other=\"x\" type=\"Europe/Paris\"><note/></mapZone>\n")),
        ZoneGenStage::Parse);
}

TEST(ZoneGenParseTest, MalformedDocumentAborts)
{
    EXPECT_EQ(failing_stage(""), ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage("<supplementalData><windowsZones>"), ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage("<supplementalData><windowsZones></supplementalData>"), ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage("<ldml><windowsZones/></ldml>"), ZoneGenStage::Parse);
    EXPECT_EQ(failing_stage("<supplementalData><version/></supplementalData>"), ZoneGenStage::Parse);
}

TEST(ZoneGenHashTest, Fnv1a64)
{
    // Reference values of 64-bit FNV-1a.
    EXPECT_EQ(Fnv1a64().Finish(), 0xcbf29ce484222325ULL);

    Fnv1a64 a;
    a.Update("a", 1);
    EXPECT_EQ(a.Finish(), 0xaf63dc4c8601ec8cULL);

    Fnv1a64 x;
    x.Update(std::string_view("ab"));
    x.Update(std::string_view("c"));
    Fnv1a64 y;
    y.Update(std::string_view("a"));
    y.Update(std::string_view("bc"));
    EXPECT_NE(x.Finish(), y.Finish());
}

TEST(ZoneGenHashTest, StableAcrossRuns)
{
    WindowsZonesData first = WindowsZonesData::Parse(fixture());
    WindowsZonesData second = WindowsZonesData::Parse(fixture());
    EXPECT_EQ(first.Hash(), second.Hash());
}

TEST(ZoneGenHashTest, ChangesWithContent)
{
    const std::string zone = "<mapZone other=\"W. Europe Standard Time\" territory=\"AT\" type=\"Europe/Vienna\"/>\n";
    uint64_t base = WindowsZonesData::Parse(document(zone)).Hash();

    EXPECT_NE(base, WindowsZonesData::Parse(document(
        "<mapZone other=\"W. Europe Standard Time\" territory=\"AT\" type=\"Europe/Berlin\"/>\n")).Hash());
    EXPECT_NE(base, WindowsZonesData::Parse(document(
        "<mapZone other=\"W. Europe Standard Time\" type=\"Europe/Vienna\"/>\n")).Hash());
    EXPECT_NE(base, WindowsZonesData::Parse(document(
        zone, "<mapTimezones otherVersion=\"7e11800\" typeVersion=\"2023c\">")).Hash());
    EXPECT_NE(base, WindowsZonesData::Parse(document(zone + zone)).Hash());

    WindowsZonesData withUtc = WindowsZonesData::Parse(document(zone));
    withUtc.AddSyntheticZones();
    EXPECT_NE(base, withUtc.Hash());
}

TEST(ZoneGenEmitTest, CppLiteral)
{
    EXPECT_EQ(zonegen_cpp_literal("Romance Standard Time"), "\"Romance Standard Time\"");
    EXPECT_EQ(zonegen_cpp_literal("a\"b\\c\n\t"), "\"a\\\"b\\\\c\\n\\t\"");
    EXPECT_EQ(zonegen_cpp_literal("Z\xC3\xBCrich"), "\"Z\\303\\274rich\"");
    EXPECT_EQ(zonegen_cpp_literal(std::string_view("\x01" "1", 2)), "\"\\0011\"");
}

TEST(ZoneGenEmitTest, FormatDate)
{
    EXPECT_EQ(zonegen_format_date(std::chrono::sys_seconds(std::chrono::seconds(1681809164))),
        "2023-04-18T09:12:44Z");
    EXPECT_EQ(zonegen_format_date(std::chrono::sys_seconds(std::chrono::seconds(0))),
        "1970-01-01T00:00:00Z");
}

TEST(ZoneGenEmitTest, BuildDate)
{
    EXPECT_FALSE(zonegen_build_date(true, "1681809164").has_value());
    EXPECT_EQ(zonegen_build_date(false, "1681809164"),
        std::chrono::sys_seconds(std::chrono::seconds(1681809164)));
    EXPECT_FALSE(zonegen_build_date(false, "yesterday").has_value());
    EXPECT_FALSE(zonegen_build_date(false, "").has_value());
    EXPECT_FALSE(zonegen_build_date(false, "-5").has_value());
    EXPECT_TRUE(zonegen_build_date(false, NULL).has_value());
}

TEST(ZoneGenEmitTest, WriteSource)
{
    WindowsZonesData data = WindowsZonesData::Parse(fixture());
    data.AddSyntheticZones();

    std::ostringstream out;
    zonegen_write_source(out, data, std::nullopt, "windowsZones.xml");
    std::string source = out.str();

    EXPECT_NE(source.find("// Generated by systz_zonegen from windowsZones.xml\n"), std::string::npos);
    EXPECT_NE(source.find("#include <libsystz/WindowsTz.h>\n"), std::string::npos);
    EXPECT_NE(source.find("namespace LibSysTz::Detail\n"), std::string::npos);
    EXPECT_NE(source.find("            std::nullopt,\n"), std::string::npos);
    EXPECT_NE(source.find("{ \"7e11800\", \"2021a\" },"), std::string::npos);

    char hash[32];
    snprintf(hash, sizeof(hash), "UINT64_C(0x%016llx)", static_cast<unsigned long long>(data.Hash()));
    EXPECT_NE(source.find(hash), std::string::npos);

    EXPECT_NE(source.find("WindowsTz(\"US Mountain Standard Time\", \"CA\", "
        "{ \"America/Creston\", \"America/Dawson_Creek\", \"America/Fort_Nelson\" }),\n"), std::string::npos);
    EXPECT_NE(source.find("WindowsTz(\"Coordinated Universal Time\", std::nullopt, { \"Etc/UTC\" }),\n"),
        std::string::npos);

    // Record order is preserved.
    EXPECT_LT(source.find("\"Dateline Standard Time\", \"001\""), source.find("\"Dateline Standard Time\", \"ZZ\""));
    EXPECT_LT(source.find("\"AUS Eastern Standard Time\""), source.find("\"Coordinated Universal Time\""));
}

TEST(ZoneGenEmitTest, WriteSourceWithBuildDate)
{
    WindowsZonesData data = WindowsZonesData::Parse(document(
        "<mapZone other=\"Tokyo Standard Time\" territory=\"001\" type=\"Asia/Tokyo\"/>\n"));

    std::ostringstream out;
    zonegen_write_source(out, data, std::chrono::sys_seconds(std::chrono::seconds(1681809164)), "test");
    EXPECT_NE(out.str().find("std::chrono::sys_seconds(std::chrono::seconds(1681809164)), // 2023-04-18T09:12:44Z\n"),
        std::string::npos);
}

class ZoneGenWriteFileTest : public ::testing::Test
{
protected:
    std::filesystem::path dir;

    void SetUp() override
    {
        std::random_device rd;
        dir = std::filesystem::temp_directory_path() / ("systz-zonegen-test-" + std::to_string(rd()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

TEST_F(ZoneGenWriteFileTest, WritesAndLeavesNoTemporary)
{
    WindowsZonesData data = WindowsZonesData::Parse(fixture());
    std::filesystem::path output = dir / "WindowsZonesData.cpp";

    zonegen_write_file(output, data, std::nullopt, "test");

    EXPECT_TRUE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(dir / "WindowsZonesData.cpp.tmp"));

    std::ostringstream expected;
    zonegen_write_source(expected, data, std::nullopt, "test");
    EXPECT_EQ(zonegen_read_file(output), expected.str());
}

TEST_F(ZoneGenWriteFileTest, MissingDirectoryFails)
{
    WindowsZonesData data = WindowsZonesData::Parse(fixture());
    try
    {
        zonegen_write_file(dir / "missing" / "WindowsZonesData.cpp", data, std::nullopt, "test");
        FAIL() << "the write succeeded";
    }
    catch (const ZoneGenException& e)
    {
        EXPECT_EQ(e.GetStage(), ZoneGenStage::Emit);
        EXPECT_EQ(std::string(e.what()).rfind("Emit: ", 0), 0u);
    }
    EXPECT_FALSE(std::filesystem::exists(dir / "missing"));
}

TEST_F(ZoneGenWriteFileTest, MissingInputFails)
{
    try
    {
        zonegen_read_file(dir / "windowsZones.xml");
        FAIL() << "the read succeeded";
    }
    catch (const ZoneGenException& e)
    {
        EXPECT_EQ(e.GetStage(), ZoneGenStage::Fetch);
    }
}
